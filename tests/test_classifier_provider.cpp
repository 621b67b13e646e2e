#include <catch2/catch.hpp>

#include "promptgate/classifier_provider.hpp"
#include "test_support.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace promptgate;
using namespace promptgate::testing;

TEST_CASE("Missing artifact means unavailable and no load", "[provider]") {
    TempDir dir;
    std::atomic<int> loads{0};
    LocalClassifierProvider provider(dir.path() / kModelId, [&](const std::filesystem::path&) -> ClassifierPtr {
        ++loads;
        return std::make_shared<FixedClassifier>(0.1);
    });

    REQUIRE(provider.acquire() == nullptr);
    REQUIRE(provider.acquire() == nullptr);
    REQUIRE(loads.load() == 0);
    REQUIRE(provider.load_attempts() == 0);
}

TEST_CASE("Artifact is loaded once and the handle reused", "[provider]") {
    TempDir dir;
    const auto artifact = install_fixture_model(dir.path());
    LocalClassifierProvider provider(artifact);

    auto first = provider.acquire();
    auto second = provider.acquire();
    REQUIRE(first != nullptr);
    REQUIRE(first == second);
    REQUIRE(provider.load_attempts() == 1);

    const Json info = provider.describe();
    REQUIRE(info.as_object().at("loaded").as_bool());
    REQUIRE(info.as_object().at("artifact_present").as_bool());
}

TEST_CASE("Concurrent first use triggers a single load", "[provider][concurrency]") {
    TempDir dir;
    const auto artifact = install_fixture_model(dir.path());
    std::atomic<int> loads{0};
    LocalClassifierProvider provider(artifact, [&](const std::filesystem::path& path) {
        ++loads;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return load_lexicon_classifier(path);
    });

    std::vector<ClassifierPtr> handles(8);
    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < handles.size(); ++i) {
        threads.emplace_back([&, i] { handles[i] = provider.acquire(); });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(loads.load() == 1);
    for (const auto& handle : handles) {
        REQUIRE(handle != nullptr);
        REQUIRE(handle == handles.front());
    }
}

TEST_CASE("Availability is re-checked on every call", "[provider]") {
    TempDir dir;
    const auto artifact = dir.path() / kModelId;
    LocalClassifierProvider provider(artifact);

    REQUIRE(provider.acquire() == nullptr);

    install_fixture_model(dir.path());
    REQUIRE(provider.acquire() != nullptr);

    std::filesystem::remove_all(artifact);
    REQUIRE(provider.acquire() == nullptr);
    REQUIRE(provider.load_attempts() == 1);
}

TEST_CASE("Failed loads are not retried until the artifact changes", "[provider]") {
    TempDir dir;
    const auto artifact = dir.path() / "guard.json";
    write_file(artifact, "{ truncated");
    const auto stamp = std::filesystem::last_write_time(artifact);

    LocalClassifierProvider provider(artifact);
    REQUIRE(provider.acquire() == nullptr);
    REQUIRE(provider.acquire() == nullptr);
    REQUIRE(provider.load_attempts() == 1);
    REQUIRE(provider.describe().as_object().at("load_failed").as_bool());

    write_file(artifact, kFixtureModel);
    std::filesystem::last_write_time(artifact, stamp + std::chrono::hours(1));
    REQUIRE(provider.acquire() != nullptr);
    REQUIRE(provider.load_attempts() == 2);
}

TEST_CASE("Model file rewritten inside the artifact directory is retried", "[provider]") {
    TempDir dir;
    const auto artifact = dir.path() / kModelId;
    write_file(artifact / "classifier.json", "{ truncated");
    const auto directory_stamp = std::filesystem::last_write_time(artifact);

    LocalClassifierProvider provider(artifact);
    REQUIRE(provider.acquire() == nullptr);
    REQUIRE(provider.acquire() == nullptr);
    REQUIRE(provider.load_attempts() == 1);

    write_file(artifact / "classifier.json", kFixtureModel);
    REQUIRE(std::filesystem::last_write_time(artifact) == directory_stamp);
    REQUIRE(provider.acquire() != nullptr);
    REQUIRE(provider.load_attempts() == 2);
    REQUIRE_FALSE(provider.describe().as_object().at("load_failed").as_bool());
}

TEST_CASE("Loader returning nothing counts as a failed load", "[provider]") {
    TempDir dir;
    const auto artifact = install_fixture_model(dir.path());
    LocalClassifierProvider provider(artifact, [](const std::filesystem::path&) -> ClassifierPtr { return nullptr; });
    REQUIRE(provider.acquire() == nullptr);
    REQUIRE(provider.load_attempts() == 1);
}

TEST_CASE("Remote provider is available only with a token", "[provider]") {
    RemoteClassifierProvider without_token("https://example.invalid/model", "", 1000);
    REQUIRE(without_token.acquire() == nullptr);
    REQUIRE_FALSE(without_token.describe().as_object().at("token_present").as_bool());

    RemoteClassifierProvider with_token("https://example.invalid/model", "hf_token", 1000);
    auto handle = with_token.acquire();
    REQUIRE(handle != nullptr);
    REQUIRE(handle == with_token.acquire());
}

TEST_CASE("Provider factory follows the configured backend", "[provider]") {
    GateConfig config;
    config.cache_root = "/nonexistent/promptgate";
    auto local = make_classifier_provider(config);
    REQUIRE(local->describe().as_object().at("backend").as_string() == "local");
    REQUIRE(local->acquire() == nullptr);

    config.backend = BackendKind::Remote;
    auto remote = make_classifier_provider(config);
    REQUIRE(remote->describe().as_object().at("backend").as_string() == "remote");
}
