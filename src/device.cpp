#include "keygate/device.hpp"

#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

// Platform detection
#if defined(__APPLE__)
#include <CoreFoundation/CoreFoundation.h>
#include <IOKit/IOKitLib.h>
#define KEYGATE_PLATFORM_MACOS 1
#elif defined(_WIN32) || defined(_WIN64)
#include <windows.h>
#define KEYGATE_PLATFORM_WINDOWS 1
#elif defined(__linux__)
#define KEYGATE_PLATFORM_LINUX 1
#endif

#if !defined(KEYGATE_PLATFORM_WINDOWS)
#include <unistd.h>
#endif

namespace keygate {
namespace device {

namespace {

constexpr std::size_t kDeviceIdLength = 32;

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

std::string sha256_hex(const std::string& input) {
    std::unique_ptr<EVP_MD_CTX, DigestContextDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return "";
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1) {
        return "";
    }

    std::ostringstream ss;
    for (unsigned int i = 0; i < length; ++i) {
        ss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(digest[i]);
    }
    return ss.str();
}

#if defined(KEYGATE_PLATFORM_MACOS)

std::string read_machine_id() {
    io_registry_entry_t entry = IORegistryEntryFromPath(kIOMainPortDefault, "IOService:/");
    if (entry == 0) {
        return "";
    }

    CFTypeRef uuid_ref =
        IORegistryEntryCreateCFProperty(entry, CFSTR(kIOPlatformUUIDKey), kCFAllocatorDefault, 0);
    IOObjectRelease(entry);
    if (uuid_ref == nullptr) {
        return "";
    }

    std::string uuid;
    if (CFGetTypeID(uuid_ref) == CFStringGetTypeID()) {
        auto uuid_string = static_cast<CFStringRef>(uuid_ref);
        CFIndex max_size =
            CFStringGetMaximumSizeForEncoding(CFStringGetLength(uuid_string), kCFStringEncodingUTF8) + 1;
        std::vector<char> buffer(static_cast<std::size_t>(max_size));
        if (CFStringGetCString(uuid_string, buffer.data(), max_size, kCFStringEncodingUTF8)) {
            uuid = buffer.data();
        }
    }
    CFRelease(uuid_ref);
    return uuid;
}

#elif defined(KEYGATE_PLATFORM_LINUX)

// First non-empty line of a file, whitespace trimmed
std::string read_first_line(const char* path) {
    std::ifstream file(path);
    std::string line;
    if (!file.is_open() || !std::getline(file, line)) {
        return "";
    }
    auto first = line.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    auto last = line.find_last_not_of(" \t\r\n");
    return line.substr(first, last - first + 1);
}

std::string read_machine_id() {
    // systemd, then dbus, then DMI (readable by root only on most systems)
    for (const char* path :
         {"/etc/machine-id", "/var/lib/dbus/machine-id", "/sys/class/dmi/id/product_uuid"}) {
        auto id = read_first_line(path);
        if (!id.empty()) {
            return id;
        }
    }
    return "";
}

#elif defined(KEYGATE_PLATFORM_WINDOWS)

std::string read_machine_id() {
    HKEY key;
    if (RegOpenKeyExA(HKEY_LOCAL_MACHINE, "SOFTWARE\\Microsoft\\Cryptography", 0,
                      KEY_READ | KEY_WOW64_64KEY, &key) != ERROR_SUCCESS) {
        return "";
    }

    char guid[256] = {0};
    DWORD size = sizeof(guid);
    DWORD type = REG_SZ;
    LONG status = RegQueryValueExA(key, "MachineGuid", nullptr, &type,
                                   reinterpret_cast<LPBYTE>(guid), &size);
    RegCloseKey(key);

    return status == ERROR_SUCCESS ? std::string(guid) : std::string();
}

#else

std::string read_machine_id() {
    return "";
}

#endif

}  // namespace

std::string hash_identifier(const std::string& raw_id) {
    if (raw_id.empty()) {
        return "";
    }
    auto hash = sha256_hex(raw_id);
    return hash.size() > kDeviceIdLength ? hash.substr(0, kDeviceIdLength) : hash;
}

std::string generate_device_id() {
    return hash_identifier(read_machine_id());
}

std::string get_platform_name() {
#if defined(KEYGATE_PLATFORM_MACOS)
    return "macos";
#elif defined(KEYGATE_PLATFORM_LINUX)
    return "linux";
#elif defined(KEYGATE_PLATFORM_WINDOWS)
    return "windows";
#else
    return "unknown";
#endif
}

std::string get_hostname() {
    char hostname[256] = {0};
#if defined(KEYGATE_PLATFORM_WINDOWS)
    DWORD size = sizeof(hostname);
    if (GetComputerNameA(hostname, &size)) {
        return std::string(hostname);
    }
#else
    if (gethostname(hostname, sizeof(hostname) - 1) == 0 && hostname[0] != '\0') {
        return std::string(hostname);
    }
#endif
    return "unknown";
}

}  // namespace device
}  // namespace keygate
