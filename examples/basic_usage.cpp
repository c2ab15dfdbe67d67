/**
 * @file basic_usage.cpp
 * @brief Basic usage example for keygate
 *
 * This example demonstrates how to:
 * - Issue activation keys from the admin side
 * - Activate a key on this device and gate the application on the verdict
 * - Subscribe to engine events
 * - Follow an admin reset through change notification
 * - Handle errors using the Result type
 *
 * Run without arguments to use an in-process store, or pass the path of a
 * store config saved with keygate::save_store_config() to talk to a hosted
 * database.
 */

#include <keygate/config.hpp>
#include <keygate/engine.hpp>
#include <keygate/http_store.hpp>
#include <keygate/issuer.hpp>
#include <keygate/json.hpp>
#include <keygate/store.hpp>
#include <keygate/verdict.hpp>

#include <any>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

int main(int argc, char* argv[]) {
    std::shared_ptr<keygate::StoreInterface> store;

    if (argc > 1) {
        auto config = keygate::load_store_config(argv[1]);
        if (config.is_error()) {
            std::cerr << "Cannot load store config: " << config.error_message() << "\n";
            return 1;
        }
        auto valid = config.value().validate();
        if (valid.is_error()) {
            std::cerr << "Invalid store config: " << valid.error_message() << "\n";
            return 1;
        }
        store = std::make_shared<keygate::HttpStore>(keygate::HttpStore::from_store_config(config.value()));
        std::cout << "Using hosted store at " << config.value().database_url << "\n";
    } else {
        store = std::make_shared<keygate::MemoryStore>();
        std::cout << "Using in-process store\n";
    }

    // Admin side
    keygate::Issuer issuer(store);

    // Application side. The device ID is derived from the machine if not provided
    keygate::EngineConfig engine_config;
    engine_config.storage_path = "/tmp/keygate_example";
    keygate::Engine engine(store, engine_config);

    std::cout << "Device ID: " << engine.device_id() << "\n";

    // Example 0: Subscribe to engine events
    auto verdict_sub = engine.on(keygate::events::VERDICT_CHANGED, [](const std::any& data) {
        auto verdict = std::any_cast<keygate::Verdict>(data);
        std::cout << "[Event] Verdict is now " << keygate::verdict_to_string(verdict) << "\n";
    });
    auto tamper_sub = engine.on(keygate::events::TAMPER_DETECTED, [](const std::any& /*data*/) {
        std::cout << "[Event] The device clock moved backwards!\n";
    });

    // Example 1: Issue a key
    std::cout << "\n=== Issue ===\n";
    auto code = issuer.issue({"Acme Trading", "+20 100 000 0000", "Front desk"}, 30);
    if (code.is_error()) {
        std::cerr << "Issue failed: " << code.error_message() << "\n";
        return 1;
    }
    std::cout << "Issued " << code.value() << "\n";

    // Example 2: Activate it on this device
    std::cout << "\n=== Activate ===\n";
    auto activation = engine.activate(code.value());
    if (activation.is_ok()) {
        const auto& binding = *activation.value().binding();
        std::cout << "Bound to " << binding.device_id << " until "
                  << keygate::json::format_timestamp(binding.expires_at) << "\n";
    } else if (activation.error_code() == keygate::ErrorCode::AlreadyUsed &&
               activation.error_state()) {
        const auto& existing = *activation.error_state();
        std::cout << "Already used"
                  << (existing.is_bound_to(engine.device_id()) ? " on this device" : " elsewhere")
                  << "\n";
    } else {
        std::cerr << "Activation failed: " << activation.error_message() << "\n";
    }

    // Example 3: Gate the application
    std::cout << "\n=== Gate ===\n";
    auto verdict = engine.current_verdict();
    if (keygate::is_runnable(verdict)) {
        std::cout << "Application may run\n";
    } else if (keygate::is_locked(verdict)) {
        std::cout << "Application is locked (" << keygate::verdict_to_string(verdict) << ")\n";
    } else {
        std::cout << "Please enter an activation code\n";
    }

    // Example 4: A second activation of the same code is rejected
    std::cout << "\n=== Second device ===\n";
    auto second = engine.activate(code.value(), "another-device");
    if (second.is_error()) {
        std::cout << "Rejected: " << keygate::error_code_to_string(second.error_code()) << "\n";
    }

    // Example 5: Admin listing and reset
    std::cout << "\n=== Listing ===\n";
    auto now = std::chrono::system_clock::now();
    auto keys = issuer.list(std::nullopt, now);
    if (keys.is_ok()) {
        for (const auto& key : keys.value()) {
            std::cout << key.code() << "  " << key.client().name << "  "
                      << keygate::key_status_to_string(key.display_status(now)) << "\n";
        }
    }

    std::cout << "\n=== Reset ===\n";
    auto reset = issuer.reset(code.value());
    if (reset.is_error()) {
        std::cerr << "Reset failed: " << reset.error_message() << "\n";
    }

    // The in-process store notifies synchronously; a hosted store pushes the
    // change over its stream, and refresh() fetches it explicitly
    auto refreshed = engine.refresh();
    if (refreshed.is_error()) {
        std::cerr << "Refresh failed: " << refreshed.error_message() << "\n";
    }
    std::cout << "Verdict after reset: " << keygate::verdict_to_string(engine.current_verdict())
              << "\n";

    // Clean up
    auto removed = issuer.remove(code.value());
    if (removed.is_error()) {
        std::cerr << "Remove failed: " << removed.error_message() << "\n";
    }
    engine.forget();

    verdict_sub.cancel();
    tamper_sub.cancel();
    return 0;
}
