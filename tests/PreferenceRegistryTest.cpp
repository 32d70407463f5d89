#include <catch2/catch_test_macros.hpp>
#include "TestHelpers.h"
#include "stores/PreferenceRegistry.h"
#include <thread>

using namespace Feedwise;
using Feedwise::Stores::PreferenceRegistry;
using Feedwise::Testing::MemoryPreferenceStore;
using Feedwise::Testing::ScopedLogCapture;

namespace {
struct RegistryFixture {
  std::shared_ptr<MemoryPreferenceStore> store = std::make_shared<MemoryPreferenceStore>();
  std::shared_ptr<Util::TaskScheduler> scheduler = std::make_shared<Util::TaskScheduler>(2);
  PreferenceRegistry registry{store, scheduler};
};
} // namespace

//==============================================================================
TEST_CASE_METHOD(RegistryFixture, "PreferenceRegistry keeps sets disjoint", "[PreferenceRegistry]") {
  SECTION("addPreferred removes the topic from blocked") {
    registry.addBlocked("default", "Gaming");
    auto result = registry.addPreferred("default", "gaming");
    REQUIRE(result.isOk());
    REQUIRE(result.getValue().isPreferred(Topic("gaming")));
    REQUIRE(registry.currentBlocked("default").getValue().count(Topic("gaming")) == 0);
  }

  SECTION("addBlocked removes the topic from preferred") {
    registry.addPreferred("default", "ASMR");
    registry.addBlocked("default", "asmr ");
    REQUIRE(registry.currentPreferred("default").getValue().count(Topic("asmr")) == 0);
    REQUIRE(registry.currentBlocked("default").getValue().count(Topic("asmr")) == 1);
  }

  SECTION("every returned snapshot is consistent") {
    for (auto *topic : {"a", "b", "a", "c", "b"}) {
      REQUIRE(registry.addPreferred("default", topic).getValue().isConsistent());
      REQUIRE(registry.addBlocked("default", topic).getValue().isConsistent());
    }
  }
}

TEST_CASE_METHOD(RegistryFixture, "PreferenceRegistry mutations are idempotent", "[PreferenceRegistry]") {
  auto once = registry.addPreferred("default", "cooking").getValue();
  auto versionAfterOnce = registry.version("default");
  auto twice = registry.addPreferred("default", "Cooking").getValue();

  REQUIRE(once == twice);
  REQUIRE(registry.version("default") == versionAfterOnce);

  SECTION("removing an absent topic is not an error") {
    auto result = registry.removeBlocked("default", "never blocked");
    REQUIRE(result.isOk());
    REQUIRE(result.getValue() == twice);
  }
}

TEST_CASE_METHOD(RegistryFixture, "PreferenceRegistry rejects invalid input", "[PreferenceRegistry]") {
  registry.addPreferred("default", "music");
  REQUIRE(registry.flush(5000));
  int savesBefore = store->saveCount;
  auto versionBefore = registry.version("default");

  SECTION("empty topic") {
    auto result = registry.addPreferred("default", "   ");
    REQUIRE(result.getErrorKind() == ErrorKind::InvalidTopic);
  }

  SECTION("topic without letters or digits") {
    auto result = registry.addBlocked("default", "!!!");
    REQUIRE(result.getErrorKind() == ErrorKind::InvalidTopic);
  }

  SECTION("empty profile") {
    auto result = registry.addPreferred("", "music");
    REQUIRE(result.getErrorKind() == ErrorKind::InvalidProfile);
    REQUIRE(registry.snapshot("").getErrorKind() == ErrorKind::InvalidProfile);
  }

  REQUIRE(registry.flush(5000));
  REQUIRE(store->saveCount == savesBefore);
  REQUIRE(registry.version("default") == versionBefore);
  REQUIRE(registry.currentPreferred("default").getValue().size() == 1);
}

TEST_CASE_METHOD(RegistryFixture, "PreferenceRegistry::togglePreferred", "[PreferenceRegistry]") {
  REQUIRE(registry.togglePreferred("default", "Jazz").getValue().isPreferred(Topic("jazz")));
  REQUIRE_FALSE(registry.togglePreferred("default", "jazz").getValue().isPreferred(Topic("jazz")));

  SECTION("toggling a blocked topic moves it to preferred") {
    registry.addBlocked("default", "drama");
    auto prefs = registry.togglePreferred("default", "drama").getValue();
    REQUIRE(prefs.isPreferred(Topic("drama")));
    REQUIRE_FALSE(prefs.isBlocked(Topic("drama")));
  }
}

TEST_CASE_METHOD(RegistryFixture, "PreferenceRegistry::completeOnboarding", "[PreferenceRegistry]") {
  SECTION("needs three distinct topics") {
    auto result = registry.completeOnboarding("default", {"Gaming", "gaming", "music"});
    REQUIRE(result.getErrorKind() == ErrorKind::InvalidTopic);
    REQUIRE(registry.snapshot("default").getValue().isEmpty());
    REQUIRE_FALSE(registry.snapshot("default").getValue().onboardingCompleted);
  }

  SECTION("an invalid topic rejects the whole pick") {
    auto result = registry.completeOnboarding("default", {"gaming", "music", "art", "  "});
    REQUIRE(result.getErrorKind() == ErrorKind::InvalidTopic);
    REQUIRE(registry.snapshot("default").getValue().isEmpty());
  }

  SECTION("prefers every topic in one mutation") {
    auto result = registry.completeOnboarding("default", {"Gaming", "Music", "Science"});
    REQUIRE(result.isOk());
    REQUIRE(result.getValue().preferred.size() == 3);
    REQUIRE(result.getValue().onboardingCompleted);
    REQUIRE(registry.version("default") == 1);

    REQUIRE(registry.flush(5000));
    REQUIRE(store->saveCount == 1);
    REQUIRE(store->stored("default") == result.getValue());
  }
}

//==============================================================================
TEST_CASE_METHOD(RegistryFixture, "PreferenceRegistry snapshots are copies", "[PreferenceRegistry]") {
  registry.addPreferred("default", "art");
  auto snapshot = registry.snapshot("default").getValue();

  snapshot.prefer(Topic("hacked"));
  REQUIRE(registry.currentPreferred("default").getValue().size() == 1);

  registry.addPreferred("default", "design");
  REQUIRE(snapshot.preferred.size() == 2);
  REQUIRE(snapshot.isPreferred(Topic("hacked")));
}

TEST_CASE_METHOD(RegistryFixture, "PreferenceRegistry profiles are independent", "[PreferenceRegistry]") {
  registry.addPreferred("alice", "cars");
  registry.addBlocked("bob", "cars");

  REQUIRE(registry.currentPreferred("alice").getValue().count(Topic("cars")) == 1);
  REQUIRE(registry.currentBlocked("bob").getValue().count(Topic("cars")) == 1);
  REQUIRE(registry.currentBlocked("alice").getValue().empty());
  REQUIRE(registry.getLoadedProfiles().size() == 2);
}

//==============================================================================
TEST_CASE_METHOD(RegistryFixture, "PreferenceRegistry change notification", "[PreferenceRegistry]") {
  SECTION("version counts changes") {
    REQUIRE(registry.version("default") == 0);
    registry.addPreferred("default", "a");
    registry.addBlocked("default", "b");
    registry.removeBlocked("default", "b");
    REQUIRE(registry.version("default") == 3);
  }

  SECTION("subscribe gets the current value, then each change") {
    registry.addPreferred("default", "a");

    std::vector<size_t> seen;
    auto unsub = registry.subscribe("default", [&seen](const PreferenceSet &prefs) {
      seen.push_back(prefs.preferred.size());
    });
    REQUIRE(unsub.isOk());

    registry.addPreferred("default", "b");
    unsub.getValue()();
    registry.addPreferred("default", "c");

    REQUIRE(seen == std::vector<size_t>{1, 2});
  }

  SECTION("subscribe rejects an empty profile") {
    auto unsub = registry.subscribe("", [](const PreferenceSet &) {});
    REQUIRE(unsub.getErrorKind() == ErrorKind::InvalidProfile);
  }

  SECTION("observe emits through rxcpp until unsubscribed") {
    std::vector<size_t> seen;
    auto subscription = registry.observe("default").subscribe(
        [&seen](const PreferenceSet &prefs) { seen.push_back(prefs.blocked.size()); });

    registry.addBlocked("default", "slime");
    subscription.unsubscribe();
    registry.addBlocked("default", "toy");

    REQUIRE(seen == std::vector<size_t>{0, 1});
  }

  SECTION("observe on an empty profile errors") {
    bool failed = false;
    registry.observe("").subscribe([](const PreferenceSet &) {}, [&failed](std::exception_ptr) { failed = true; });
    REQUIRE(failed);
  }
}

//==============================================================================
TEST_CASE("PreferenceRegistry persistence failures", "[PreferenceRegistry]") {
  auto store = std::make_shared<MemoryPreferenceStore>();
  auto scheduler = std::make_shared<Util::TaskScheduler>(1);

  SECTION("a failed save keeps memory, logs a warning and calls the handler") {
    ScopedLogCapture logs;
    PreferenceRegistry registry(store, scheduler);

    std::mutex mutex;
    juce::StringArray failures;
    registry.setSaveFailureHandler([&](const juce::String &profileId, const juce::String &message) {
      std::lock_guard<std::mutex> lock(mutex);
      failures.add(profileId + ": " + message);
    });

    store->failSaves = true;
    auto result = registry.addBlocked("default", "clickbait");
    REQUIRE(result.isOk());
    REQUIRE(registry.flush(5000));

    REQUIRE(registry.currentBlocked("default").getValue().count(Topic("clickbait")) == 1);
    {
      std::lock_guard<std::mutex> lock(mutex);
      REQUIRE(failures.size() == 1);
      REQUIRE(failures[0] == "default: disk full");
    }
    REQUIRE(logs.contains(Util::LogLevel::Warning, "Save failed"));

    SECTION("the next successful save persists the whole set") {
      store->failSaves = false;
      registry.addBlocked("default", "gossip");
      REQUIRE(registry.flush(5000));
      REQUIRE(store->stored("default").blocked.size() == 2);
    }
  }

  SECTION("a store that throws is reported and does not stall flush") {
    ScopedLogCapture logs;
    PreferenceRegistry registry(store, scheduler);

    std::atomic<int> reports{0};
    registry.setSaveFailureHandler([&reports](const juce::String &, const juce::String &message) {
      if (message.contains("store exploded"))
        ++reports;
    });

    store->throwSaves = true;
    REQUIRE(registry.addPreferred("default", "chess").isOk());
    REQUIRE(registry.flush(1000));
    REQUIRE(reports == 1);
    REQUIRE(logs.contains(Util::LogLevel::Warning, "Save failed"));

    store->throwSaves = false;
    registry.addPreferred("default", "go");
    REQUIRE(registry.flush(1000));
    REQUIRE(store->stored("default").preferred.size() == 2);
  }

  SECTION("a failed load starts empty and is reported") {
    PreferenceSet saved;
    saved.prefer(Topic("hidden"));
    store->seed("default", saved);
    store->failLoads = true;

    PreferenceRegistry registry(store, scheduler);
    int reports = 0;
    registry.setSaveFailureHandler([&reports](const juce::String &, const juce::String &) { ++reports; });

    auto loaded = registry.loadProfile("default");
    REQUIRE(loaded.getErrorKind() == ErrorKind::StoreUnavailable);
    REQUIRE(registry.snapshot("default").getValue().isEmpty());
    REQUIRE(reports == 1);

    SECTION("storedSnapshot surfaces the load failure") {
      auto stored = registry.storedSnapshot("default");
      REQUIRE(stored.isError());
      REQUIRE(stored.getErrorKind() == ErrorKind::StoreUnavailable);
      REQUIRE(registry.snapshot("default").isOk());
    }

    SECTION("load is attempted once per profile") {
      registry.snapshot("default");
      registry.loadProfile("default");
      REQUIRE(store->loadCount == 1);
    }

    SECTION("the next save replaces the unreadable data") {
      registry.addPreferred("default", "fresh");
      REQUIRE(registry.flush(5000));
      REQUIRE(store->stored("default").preferred == TopicSet{Topic("fresh")});
    }
  }

  SECTION("loaded profiles start from the stored set") {
    PreferenceSet saved;
    saved.prefer(Topic("chess"));
    store->seed("default", saved);

    PreferenceRegistry registry(store, scheduler);
    REQUIRE(registry.loadProfile("default").isOk());
    REQUIRE(registry.snapshot("default").getValue() == saved);
    REQUIRE(registry.storedSnapshot("default").getValue() == saved);
    REQUIRE(registry.storedSnapshot("").getErrorKind() == ErrorKind::InvalidProfile);
  }
}

TEST_CASE("PreferenceRegistry skips superseded saves", "[PreferenceRegistry]") {
  auto store = std::make_shared<MemoryPreferenceStore>();
  auto scheduler = std::make_shared<Util::TaskScheduler>(1);
  PreferenceRegistry registry(store, scheduler);

  store->saveDelayMs = 50;
  for (int i = 0; i < 10; ++i)
    registry.addPreferred("default", "topic " + juce::String(i));

  REQUIRE(registry.flush(10000));
  REQUIRE(store->saveCount < 10);
  REQUIRE(store->stored("default").preferred.size() == 10);
  REQUIRE(store->stored("default") == registry.snapshot("default").getValue());
}

TEST_CASE("PreferenceRegistry concurrent mutations", "[PreferenceRegistry]") {
  auto store = std::make_shared<MemoryPreferenceStore>();
  auto scheduler = std::make_shared<Util::TaskScheduler>(4);
  PreferenceRegistry registry(store, scheduler);

  SECTION("two callers on different topics both persist") {
    std::thread first([&registry]() { registry.addPreferred("default", "physics"); });
    std::thread second([&registry]() { registry.addPreferred("default", "chemistry"); });
    first.join();
    second.join();

    REQUIRE(registry.flush(5000));
    auto stored = store->stored("default");
    REQUIRE(stored.isPreferred(Topic("physics")));
    REQUIRE(stored.isPreferred(Topic("chemistry")));
  }

  SECTION("many writers and readers never see a torn set") {
    std::atomic<bool> inconsistent{false};
    std::vector<std::thread> threads;

    for (int t = 0; t < 4; ++t) {
      threads.emplace_back([&registry, &inconsistent, t]() {
        for (int i = 0; i < 50; ++i) {
          auto topic = "shared " + juce::String(i % 5);
          auto prefs = (t % 2 == 0) ? registry.addPreferred("default", topic) : registry.addBlocked("default", topic);
          if (!prefs.getValue().isConsistent())
            inconsistent = true;
          if (!registry.snapshot("default").getValue().isConsistent())
            inconsistent = true;
        }
      });
    }
    for (auto &thread : threads)
      thread.join();

    REQUIRE_FALSE(inconsistent);
    REQUIRE(registry.flush(5000));
    REQUIRE(store->stored("default") == registry.snapshot("default").getValue());
  }
}
