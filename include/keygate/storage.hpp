#pragma once

/**
 * @file storage.hpp
 * @brief Device-local persistence for the activation engine
 *
 * Holds what must survive an application restart on this device: the
 * remembered activation code with its last known record, the anti-rollback
 * watermark, the latched verdict and the latches held for codes the engine
 * has since forgotten. None of it is ever written to the shared key store.
 */

#include "keygate/keygate.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace keygate {

/**
 * @brief Remembered activation with its last known record
 */
struct CachedActivation {
    std::string code;

    /// Device the code was redeemed for on this machine
    std::string device_id;

    /// Last record seen for the code (std::nullopt once the record was removed)
    std::optional<ActivationKey> record;

    /// When the record was last received from the store
    Timestamp last_synced;
};

/**
 * @brief Storage interface for device-local engine state
 */
class StorageInterface {
  public:
    virtual ~StorageInterface() = default;

    /// Store the remembered activation
    virtual bool set_activation(const CachedActivation& activation) = 0;

    /// Retrieve the remembered activation
    virtual std::optional<CachedActivation> get_activation() = 0;

    /// Clear the remembered activation
    virtual void clear_activation() = 0;

    /// Store the watermark (latest local time observed by the engine)
    virtual bool set_watermark(Timestamp watermark) = 0;

    /// Get the watermark
    virtual std::optional<Timestamp> get_watermark() = 0;

    /// Store the latched verdict
    virtual bool set_verdict(Verdict verdict) = 0;

    /// Get the latched verdict
    virtual std::optional<Verdict> get_verdict() = 0;

    /// Keep a latched verdict for a code that is no longer tracked
    virtual bool set_held_verdict(const std::string& code, Verdict verdict) = 0;

    /// Get the verdict held for code, if any
    virtual std::optional<Verdict> get_held_verdict(const std::string& code) = 0;

    /// Drop the verdict held for code
    virtual void clear_held_verdict(const std::string& code) = 0;

    /// Clear all stored data, watermark included
    virtual void clear_all() = 0;
};

/**
 * @brief File-based storage implementation
 *
 * Keeps one small JSON file per concern in the storage directory. Files are
 * replaced atomically (write to a temporary file, then rename) so a crash
 * mid-write never leaves a truncated watermark behind.
 */
class FileStorage : public StorageInterface {
  public:
    /**
     * @brief Construct file storage
     *
     * @param storage_path Directory path for storage
     * @param prefix Optional prefix for file names
     */
    explicit FileStorage(const std::string& storage_path, const std::string& prefix = "keygate");

    bool set_activation(const CachedActivation& activation) override;
    std::optional<CachedActivation> get_activation() override;
    void clear_activation() override;

    bool set_watermark(Timestamp watermark) override;
    std::optional<Timestamp> get_watermark() override;

    bool set_verdict(Verdict verdict) override;
    std::optional<Verdict> get_verdict() override;

    bool set_held_verdict(const std::string& code, Verdict verdict) override;
    std::optional<Verdict> get_held_verdict(const std::string& code) override;
    void clear_held_verdict(const std::string& code) override;

    void clear_all() override;

  private:
    std::filesystem::path get_activation_path() const;
    std::filesystem::path get_watermark_path() const;
    std::filesystem::path get_verdict_path() const;
    std::filesystem::path get_held_path() const;

    std::map<std::string, Verdict> read_held();
    bool write_held(const std::map<std::string, Verdict>& held);

    bool ensure_directory() const;
    bool write_file(const std::filesystem::path& path, const std::string& content);
    std::optional<std::string> read_file(const std::filesystem::path& path);
    void remove_file(const std::filesystem::path& path);

    std::filesystem::path storage_path_;
    std::string prefix_;
    mutable std::mutex mutex_;
};

/**
 * @brief In-memory storage implementation (for testing or no persistence)
 */
class MemoryStorage : public StorageInterface {
  public:
    bool set_activation(const CachedActivation& activation) override;
    std::optional<CachedActivation> get_activation() override;
    void clear_activation() override;

    bool set_watermark(Timestamp watermark) override;
    std::optional<Timestamp> get_watermark() override;

    bool set_verdict(Verdict verdict) override;
    std::optional<Verdict> get_verdict() override;

    bool set_held_verdict(const std::string& code, Verdict verdict) override;
    std::optional<Verdict> get_held_verdict(const std::string& code) override;
    void clear_held_verdict(const std::string& code) override;

    void clear_all() override;

  private:
    std::optional<CachedActivation> activation_;
    std::optional<Timestamp> watermark_;
    std::optional<Verdict> verdict_;
    std::map<std::string, Verdict> held_;
    mutable std::mutex mutex_;
};

}  // namespace keygate
