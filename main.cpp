#include "concurrency/Semaphore.h"
#include "concurrency/ThreadUtils.h"
#include "config/Config.h"
#include "jobmanager/JobManager.h"
#include "jobmanager/TimerQueue.h"
#include "jobmanager/WorkerThread.h"
#include "logger/Logger.h"
#include "roster/CallParticipantsContext.h"
#include "roster/CallParticipantsListener.h"
#include "roster/RosterSettings.h"
#include "simulator/SimulatedCallServer.h"
#include "utils/MersienneRandom.h"
#include "utils/Time.h"
#include <algorithm>
#include <cassert>
#include <cinttypes>
#include <execinfo.h>
#include <iostream>
#include <memory>
#include <signal.h>
#include <unordered_map>

namespace
{

std::unique_ptr<concurrency::Semaphore> running;
std::unordered_map<int32_t, struct sigaction> oldSignalHandlers;

void fatalSignalHandler(int32_t signalId)
{
    void* array[16];
    const auto size = backtrace(array, 16);
    char** strings = backtrace_symbols(array, size);
    logger::errorImmediate("Fatal signal %d, %d stack frames.", "fatalSignalHandler", signalId, size);

    for (auto i = 0; i < size; ++i)
    {
        logger::errorImmediate("%s", "fatalSignalHandler", strings[i]);
    }
    free(strings);

    logger::flushLog();

    auto oldSignalHandlersItr = oldSignalHandlers.find(signalId);
    if (oldSignalHandlersItr != oldSignalHandlers.end())
    {
        if (sigaction(signalId, &oldSignalHandlersItr->second, nullptr) != 0)
        {
            exit(signalId);
        }
    }
}

void intSignalHandler(int32_t)
{
    logger::info("SIGINT", "main");
    assert(running);
    running->post();
}

class RosterStatistics : public roster::CallParticipantsListener
{
public:
    RosterStatistics() : stateChanges(0), joins(0), leaves(0), speakerChanges(0) {}

    void onParticipantsStateChanged(const roster::ParticipantsState&) override { ++stateChanges; }
    void onActiveSpeakersChanged(const std::unordered_set<roster::PeerId>&) override { ++speakerChanges; }
    void onMemberEvent(const roster::MemberEvent& event) override { event.joined ? ++joins : ++leaves; }

    uint32_t stateChanges;
    uint32_t joins;
    uint32_t leaves;
    uint32_t speakerChanges;
};

// Runs task on the roster thread and waits for it.
template <typename Callable>
bool runOnRosterThread(jobmanager::JobManager& jobManager, Callable&& task)
{
    concurrency::Semaphore done;
    const bool posted = jobManager.addCallable([&task, &done]() {
        task();
        done.post();
    });
    if (!posted)
    {
        return false;
    }
    done.wait();
    return true;
}

void postToRoster(jobmanager::JobManager& jobManager,
    concurrency::SynchronizationContext::Task&& task,
    const char* what)
{
    if (!jobManager.post(std::move(task)))
    {
        logger::warn("roster thread busy, %s dropped", "rostersim", what);
    }
}

void logSnapshot(const roster::CallParticipantsContext& context, const RosterStatistics& statistics)
{
    const auto& state = context.getState();
    logger::info("version %d, %zu of %d participants loaded, phase %s, %zu pending edits, %zu speaking",
        "rostersim",
        state.version,
        state.participants.size(),
        state.totalCount,
        roster::toString(context.getUpdatePhase()),
        context.getInternalState().overlayState.pendingMuteStateChanges.size(),
        context.getActiveSpeakers().size());
    logger::info("state changes %u, joins %u, leaves %u",
        "rostersim",
        statistics.stateChanges,
        statistics.joins,
        statistics.leaves);

    const size_t topCount = std::min(size_t(5), state.participants.size());
    for (size_t i = 0; i < topCount; ++i)
    {
        const auto& participant = state.participants[i];
        logger::debug("#%zu peer %" PRIu64 " rank %d ts %.1f join %d%s",
            "rostersim",
            i,
            participant.peerId,
            participant.activityRank.value_or(-1),
            participant.activityTimestamp.value_or(0.0),
            participant.joinTimestamp,
            participant.muteState ? " muted" : "");
    }
}

} // namespace

int main(int argc, char** argv)
{
    running = std::make_unique<concurrency::Semaphore>();
    concurrency::setThreadName("main");

    {
        struct sigaction sigactionData = {};
        sigactionData.sa_handler = intSignalHandler;
        sigactionData.sa_flags = 0;
        sigemptyset(&sigactionData.sa_mask);
        sigaction(SIGINT, &sigactionData, nullptr);
        sigaction(SIGTERM, &sigactionData, nullptr);
    }

    {
        struct sigaction sigactionData = {};
        sigactionData.sa_handler = fatalSignalHandler;
        sigactionData.sa_flags = 0;
        sigemptyset(&sigactionData.sa_mask);
        struct sigaction oldHandler = {};

        for (auto signalId : {SIGPIPE, SIGSEGV, SIGBUS, SIGABRT, SIGILL, SIGFPE, SIGSYS})
        {
            sigaction(signalId, &sigactionData, &oldHandler);
            oldSignalHandlers.emplace(signalId, oldHandler);
        }
    }

    const auto config = std::make_unique<config::Config>();
    if (argc >= 2 && !config->readFromFile(argv[1]))
    {
        std::cerr << "Usage: rostersim [config.json]" << std::endl;
        return 1;
    }

    utils::Time::initialize();
    logger::setup(config->logFile.get().c_str(),
        config->logStdOut,
        false,
        logger::parseLevel(config->logLevel.get().c_str()));
    logger::logAlways("log level %s", "main", config->logLevel.get().c_str());
    logger::debug("config %s", "main", config->dump().c_str());
    logger::info("simulating call %" PRId64 " with %u participants for %us",
        "main",
        config->call.id.get(),
        config->simulator.participantCount.get(),
        config->simulator.runTimeSec.get());

    {
        jobmanager::TimerQueue timers;
        jobmanager::JobManager rosterJobs(timers);
        jobmanager::JobManager networkJobs;
        jobmanager::WorkerThread rosterThread(rosterJobs, "Roster");
        jobmanager::WorkerThread networkThread(networkJobs, "Network");

        simulator::SimulatedCallServer::Settings serverSettings;
        serverSettings.callId = config->call.id;
        serverSettings.myPeerId = config->call.myPeerId;
        serverSettings.participantCount = config->simulator.participantCount;
        serverSettings.gapEveryNthUpdate = config->simulator.gapEveryNthUpdate;
        serverSettings.mutationFailureEveryNth = config->simulator.mutationFailureEveryNth;
        serverSettings.seed = config->simulator.seed;
        simulator::SimulatedCallServer server(serverSettings, networkJobs);

        const auto rosterSettings = roster::RosterSettings::fromConfig(*config);
        RosterStatistics statistics;
        std::unique_ptr<roster::CallParticipantsContext> context;
        const bool created = runOnRosterThread(rosterJobs, [&]() {
            context = std::make_unique<roster::CallParticipantsContext>(config->call.id,
                config->call.myPeerId,
                server.makeInitialState(rosterSettings.fetchLimit),
                std::nullopt,
                server,
                server,
                rosterJobs,
                rosterSettings);
            context->addListener(&statistics);
        });
        if (!created)
        {
            logger::error("failed to create call roster", "main");
            timers.stop();
            logger::stop();
            return 1;
        }

        const uint64_t startTime = utils::Time::getAbsoluteTime();
        uint64_t nextSpeakerReport = startTime;
        uint64_t nextSnapshotLog = startTime + config->simulator.snapshotLogIntervalMs * utils::Time::ms;
        utils::MersienneRandom<uint32_t> random(config->simulator.seed + 1);

        while (!running->wait(config->simulator.updateIntervalMs))
        {
            const uint64_t timestamp = utils::Time::getAbsoluteTime();
            if (utils::Time::diffGE(startTime, timestamp, config->simulator.runTimeSec * utils::Time::sec))
            {
                break;
            }

            auto updates = server.tick();
            if (!updates.empty())
            {
                postToRoster(rosterJobs, [&context, updates]() { context->onPushedUpdates(updates); }, "push");
            }

            if (random.oneIn(4))
            {
                auto peerId = server.pickParticipant();
                if (peerId)
                {
                    const bool mute = random.oneIn(2);
                    postToRoster(
                        rosterJobs,
                        [&context, peerId, mute]() {
                            context->updateMuteState(*peerId,
                                mute ? std::make_optional(roster::MuteState(false, true)) : std::nullopt,
                                std::nullopt,
                                std::nullopt);
                        },
                        "edit");
                }
            }

            if (utils::Time::diffGE(nextSpeakerReport, timestamp, 0))
            {
                nextSpeakerReport = timestamp + config->simulator.speakerReportIntervalMs * utils::Time::ms;
                auto speakers = server.pickSpeakers(3);
                const double now = utils::Time::nowSeconds();
                postToRoster(
                    rosterJobs,
                    [&context, speakers, now]() {
                        std::vector<std::pair<roster::PeerId, double>> activities;
                        for (const auto& speaker : speakers)
                        {
                            activities.emplace_back(speaker.first, now);
                        }
                        context->updatePeerActivities(activities);
                        context->reportSpeakingParticipants(speakers);
                    },
                    "speaker report");
            }

            if (utils::Time::diffGE(nextSnapshotLog, timestamp, 0))
            {
                nextSnapshotLog = timestamp + config->simulator.snapshotLogIntervalMs * utils::Time::ms;
                postToRoster(
                    rosterJobs,
                    [&context, &statistics]() {
                        const auto& state = context->getState();
                        if (state.nextParticipantsFetchOffset)
                        {
                            context->loadMore(*state.nextParticipantsFetchOffset);
                        }
                        logSnapshot(*context, statistics);
                    },
                    "snapshot");
            }
        }

        const bool finished = runOnRosterThread(rosterJobs, [&]() {
            logSnapshot(*context, statistics);
            logger::info("server version %d, %zu participants, %u versions withheld",
                "main",
                server.getVersion(),
                server.getParticipantCount(),
                server.getWithheldCount());
            context->removeListener(&statistics);
            context.reset();
        });
        if (!finished)
        {
            logger::warn("roster thread did not take shutdown job", "main");
        }

        networkThread.stop();
        rosterThread.stop();
        timers.stop();
        networkJobs.stop();
        rosterJobs.stop();
    }

    if (logger::getDroppedLogCount() > 0)
    {
        logger::warn("%u log lines dropped on full backlog", "main", logger::getDroppedLogCount());
    }
    logger::stop();
    return 0;
}
