#include "../core/EngineConfig.h"
#include "../feed/FeedPersonalizer.h"
#include "../stores/FilePreferenceStore.h"
#include "../stores/PreferenceRegistry.h"
#include "../stores/TopicTaxonomy.h"
#include "../util/logging/Logger.h"
#include <JuceHeader.h>
#include <iostream>

using namespace Feedwise;

namespace {

const juce::String kCategory = "CLI";

/**
 * Store, scheduler and registry wired from the settings for one command.
 * Save failures are collected so the command can exit non-zero.
 */
class Engine {
public:
  explicit Engine(const EngineConfig &config)
      : store(std::make_shared<Stores::FilePreferenceStore>(config.preferencesDirectory)),
        scheduler(std::make_shared<Util::TaskScheduler>(static_cast<size_t>(config.schedulerThreads))),
        registry(store, scheduler), personalizer(ContentFilter(config.filter)) {
    registry.setSaveFailureHandler([this](const juce::String &profileId, const juce::String &message) {
      std::lock_guard<std::mutex> lock(failureMutex);
      failures.add(profileId + ": " + message);
    });
  }

  Stores::PreferenceRegistry &getRegistry() {
    return registry;
  }

  const FeedPersonalizer &getPersonalizer() const {
    return personalizer;
  }

  /** Wait for saves and fail the command if any of them did not land */
  void flushOrFail() {
    registry.flush();

    std::lock_guard<std::mutex> lock(failureMutex);
    if (!failures.isEmpty())
      juce::ConsoleApplication::fail(failures.joinIntoString("\n"));
  }

private:
  std::shared_ptr<Stores::FilePreferenceStore> store;
  std::shared_ptr<Util::TaskScheduler> scheduler;
  Stores::PreferenceRegistry registry;
  FeedPersonalizer personalizer;

  std::mutex failureMutex;
  juce::StringArray failures;
};

/** Pops --settings=<file> and --verbose off the argument list and installs logging */
EngineConfig loadConfig(juce::ArgumentList &args) {
  auto settingsPath = args.removeValueForOption("--settings");
  bool verbose = args.removeOptionIfFound("--verbose");

  auto config = settingsPath.isNotEmpty()
                    ? EngineConfig::loadFrom(juce::File::getCurrentWorkingDirectory().getChildFile(settingsPath))
                    : EngineConfig::load();

  // Keep stdout for command output unless asked otherwise
  if (!verbose && config.logLevel < Util::LogLevel::Warning)
    config.logLevel = Util::LogLevel::Warning;

  config.applyLogging();
  return config;
}

juce::String argumentAt(const juce::ArgumentList &args, int index, const juce::String &name) {
  if (index >= args.size() || args[index].text.isEmpty())
    juce::ConsoleApplication::fail("Missing " + name);
  return args[index].text;
}

/** Everything after the profile, joined so "family vlog" works unquoted */
juce::String topicArgument(const juce::ArgumentList &args) {
  juce::StringArray words;
  for (int i = 2; i < args.size(); ++i)
    words.add(args[i].text);

  if (words.isEmpty())
    juce::ConsoleApplication::fail("Missing topic");
  return words.joinIntoString(" ");
}

void printLine(const juce::String &text) {
  std::cout << text.toStdString() << "\n";
}

void printPreferences(const juce::String &profileId, const PreferenceSet &prefs) {
  printLine("profile:    " + profileId);
  printLine("preferred:  " + describeTopics(prefs.preferred));
  printLine("blocked:    " + describeTopics(prefs.blocked));
  printLine(juce::String("onboarding: ") + (prefs.onboardingCompleted ? "done" : "pending"));
}

void failOn(ErrorKind kind, const juce::String &message) {
  juce::ConsoleApplication::fail(juce::String(errorKindToString(kind)) + ": " + message);
}

template <typename T> T valueOrFail(const Outcome<T> &result) {
  if (result.isError())
    failOn(result.getErrorKind(), result.getError());
  return result.getValue();
}

using Mutation = Outcome<PreferenceSet> (Stores::PreferenceRegistry::*)(const juce::String &, const juce::String &);

juce::ConsoleApplication::Command mutationCommand(const juce::String &option, const juce::String &description,
                                                  Mutation mutation) {
  return {option, option + " <profile> <topic>", description, {}, [mutation](const juce::ArgumentList &input) {
            auto args = input;
            auto config = loadConfig(args);
            auto profileId = argumentAt(args, 1, "profile");
            auto topic = topicArgument(args);

            Engine engine(config);
            auto prefs = valueOrFail((engine.getRegistry().*mutation)(profileId, topic));
            engine.flushOrFail();
            printPreferences(profileId, prefs);
          }};
}

void showCategories(const juce::ArgumentList &input) {
  auto args = input;
  loadConfig(args);

  for (const auto &category : Stores::TopicTaxonomy::builtIn().categories()) {
    juce::StringArray topics;
    for (const auto &topic : category.topics)
      topics.add(topic.getText());
    printLine(category.icon + " " + Stores::TopicTaxonomy::displayName(category) + ": " +
              topics.joinIntoString(", "));
  }
}

void showProfile(const juce::ArgumentList &input) {
  auto args = input;
  auto config = loadConfig(args);
  auto profileId = argumentAt(args, 1, "profile");

  Engine engine(config);
  printPreferences(profileId, valueOrFail(engine.getRegistry().storedSnapshot(profileId)));
}

void suggestBlocks(const juce::ArgumentList &input) {
  auto args = input;
  auto config = loadConfig(args);
  auto profileId = argumentAt(args, 1, "profile");

  Engine engine(config);
  auto prefs = valueOrFail(engine.getRegistry().storedSnapshot(profileId));
  for (const auto &topic : Stores::TopicTaxonomy::builtIn().blockSuggestions(prefs))
    printLine(topic.getText());
}

void completeOnboarding(const juce::ArgumentList &input) {
  auto args = input;
  auto config = loadConfig(args);
  auto profileId = argumentAt(args, 1, "profile");

  juce::StringArray topics;
  for (int i = 2; i < args.size(); ++i)
    topics.add(args[i].text);

  Engine engine(config);
  auto prefs = valueOrFail(engine.getRegistry().completeOnboarding(profileId, topics));
  engine.flushOrFail();
  printPreferences(profileId, prefs);
}

void filterFeed(const juce::ArgumentList &input) {
  auto args = input;
  auto config = loadConfig(args);
  auto profileId = argumentAt(args, 1, "profile");
  auto feedFile = juce::File::getCurrentWorkingDirectory().getChildFile(argumentAt(args, 2, "feed file"));

  if (!feedFile.existsAsFile())
    juce::ConsoleApplication::fail("Feed file not found: " + feedFile.getFullPathName());

  auto items = valueOrFail(parseContentItems(feedFile.loadFileAsString()));

  Engine engine(config);
  auto prefs = valueOrFail(engine.getRegistry().storedSnapshot(profileId));
  const auto &personalizer = engine.getPersonalizer();

  auto feed = personalizer.apply(items, prefs);
  printLine("visible:");
  while (auto decision = feed.nextDecision()) {
    printLine(juce::String::formatted("  %+.1f  ", decision->relevanceDelta) + decision->item.id + "  " +
              decision->item.title + "  (" + decision->explain() + ")");
  }

  printLine("hidden:");
  for (const auto &decision : personalizer.explain(items, prefs)) {
    if (!decision.visible)
      printLine("  " + decision.item.id + "  " + decision.item.title + "  (" + decision.explain() + ")");
  }

  Util::logDebug(kCategory, "Filtered feed", "profile=" + profileId + " file=" + feedFile.getFullPathName());
}

} // namespace

int main(int argc, char *argv[]) {
  juce::ConsoleApplication app;

  app.addHelpCommand("--help|-h", "Usage: feedwise <command> [--settings=<file>] [--verbose]", true);
  app.addVersionCommand("--version|-v", juce::String("feedwise ") + FEEDWISE_VERSION);

  app.addCommand({"--categories", "--categories", "Print the topic catalog", {}, showCategories});
  app.addCommand({"--show", "--show <profile>", "Print preferred and blocked topics", {}, showProfile});
  app.addCommand(mutationCommand("--prefer", "Add a preferred topic", &Stores::PreferenceRegistry::addPreferred));
  app.addCommand(
      mutationCommand("--unprefer", "Remove a preferred topic", &Stores::PreferenceRegistry::removePreferred));
  app.addCommand(mutationCommand("--block", "Block a topic", &Stores::PreferenceRegistry::addBlocked));
  app.addCommand(mutationCommand("--unblock", "Unblock a topic", &Stores::PreferenceRegistry::removeBlocked));
  app.addCommand(
      mutationCommand("--toggle", "Toggle a preferred topic", &Stores::PreferenceRegistry::togglePreferred));
  app.addCommand({"--onboard", "--onboard <profile> <topic> <topic> <topic>...",
                  "Prefer the picked topics and finish onboarding", {}, completeOnboarding});
  app.addCommand({"--suggest", "--suggest <profile>", "Print block suggestions", {}, suggestBlocks});
  app.addCommand({"--filter", "--filter <profile> <feed.json>",
                  "Personalize a JSON array of content items", {}, filterFeed});

  return app.findAndRunCommand(argc, argv);
}
