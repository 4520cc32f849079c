#pragma once

#include "clock.hpp"
#include "config.hpp"
#include "event_log.hpp"
#include "inbound_queue.hpp"
#include "listener.hpp"
#include "log.hpp"
#include "peer_link.hpp"
#include "random.hpp"
#include "weighted_choice.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace scalemodel
{
    enum class MachineState : std::uint8_t
    {
        Initializing = 0,
        Running = 1,
        ShuttingDown = 2,
        Terminated = 3,
    };

    inline const char *machine_state_name(MachineState s) noexcept
    {
        switch (s)
        {
        case MachineState::Initializing:
            return "INITIALIZING";
        case MachineState::Running:
            return "RUNNING";
        case MachineState::ShuttingDown:
            return "SHUTTING_DOWN";
        case MachineState::Terminated:
            return "TERMINATED";
        }
        return "UNKNOWN";
    }

    // What an idle tick does.
    enum class Action : std::uint8_t
    {
        SendOne = 1,   // one randomly chosen peer
        SendOther = 2, // the "second" peer: active[1 % n]
        SendAll = 3,   // every active peer
        Internal = 4,
    };

    inline EventType event_type_for(Action a) noexcept
    {
        switch (a)
        {
        case Action::SendOne:
            return EventType::SendOne;
        case Action::SendOther:
            return EventType::SendOther;
        case Action::SendAll:
            return EventType::SendAll;
        case Action::Internal:
            return EventType::Internal;
        }
        return EventType::Internal;
    }

    inline constexpr std::uint32_t kActionWeightResolution = 1000;

    // Internal gets round(p * resolution); the rest is split across the three
    // send actions, any remainder going to SendAll.
    inline WeightedChoice<Action> make_action_table(double internalProbability)
    {
        if (!(internalProbability >= 0.0 && internalProbability <= 1.0))
        {
            throw std::invalid_argument("make_action_table: probability must be in [0,1]");
        }
        const auto internal = static_cast<std::uint32_t>(internalProbability * kActionWeightResolution + 0.5);
        const std::uint32_t rest = kActionWeightResolution - internal;
        const std::uint32_t each = rest / 3;

        WeightedChoice<Action> t;
        t.add(Action::SendOne, each);
        t.add(Action::SendOther, each);
        t.add(Action::SendAll, rest - 2 * each);
        t.add(Action::Internal, internal);
        return t;
    }

    // One node of the cluster: Lamport clock, inbound queue, peer links and the
    // tick-driven event loop. All clock and link mutation happens on the thread
    // that calls init/run/tick/shutdown; network threads only enqueue.
    class Machine
    {
    public:
        struct Stats
        {
            std::uint64_t ticks = 0;
            std::uint64_t receiveEvents = 0;
            std::uint64_t sendEvents = 0;
            std::uint64_t internalEvents = 0;
            std::uint64_t messagesSent = 0;
            std::uint64_t sendFailures = 0;
            std::uint64_t unreachablePeers = 0;
            std::uint64_t droppedPeers = 0;
            std::uint64_t tickErrors = 0;
        };

        // A null sink opens machine_<id>.log under cfg.logDir.
        explicit Machine(MachineConfig cfg, std::shared_ptr<IRecordSink> sink = nullptr)
            : m_cfg(std::move(cfg)),
              m_sink(std::move(sink)),
              m_rng(m_cfg.seed == 0 ? 0 : mix_u64(m_cfg.seed, m_cfg.id)),
              m_actions(make_action_table(m_cfg.internalProbability)),
              m_listener(m_inbound, m_cfg.id)
        {
            Logger::instance().set_level(m_cfg.logLevel);
            if (!m_sink)
            {
                m_sink = std::make_shared<FileRecordSink>(FileRecordSink::path_for(m_cfg.logDir, m_cfg.id));
            }
        }

        ~Machine()
        {
            try
            {
                shutdown();
            }
            catch (const std::exception &e)
            {
                Logger::instance().logf(LogLevel::Error, m_cfg.id, "shutdown during destruction failed: %s", e.what());
            }
        }

        Machine(const Machine &) = delete;
        Machine &operator=(const Machine &) = delete;

        // INITIALIZING -> RUNNING. Throws if the listening socket cannot be bound;
        // unreachable peers are logged and left out.
        void init()
        {
            if (m_state != MachineState::Initializing || m_initAttempted)
            {
                throw std::runtime_error("Machine::init: already initialized");
            }
            m_initAttempted = true;

            m_clock.reset();
            m_ticksPerSecond = m_cfg.ticksPerSecond != 0
                                   ? m_cfg.ticksPerSecond
                                   : static_cast<std::uint32_t>(m_rng.uniform_range(1, m_cfg.maxTicksPerSecond));

            bind();

            for (const auto &peer : m_cfg.peers)
            {
                if (is_self(m_cfg, peer))
                {
                    continue;
                }
                auto link = PeerLink::connect(peer, m_cfg.connectRetry, m_cfg.id);
                if (!link)
                {
                    ++m_stats.unreachablePeers;
                    continue;
                }
                m_links.push_back(std::move(link));
            }

            emit_(EventType::Init, std::nullopt, "ticks=" + std::to_string(m_ticksPerSecond));
            m_state = MachineState::Running;
            Logger::instance().logf(LogLevel::Info, m_cfg.id, "running at %u ticks/s with %zu of %zu peers",
                                    static_cast<unsigned>(m_ticksPerSecond), m_links.size(), m_cfg.peers.size());
        }

        // Starts the listener ahead of init() and returns the bound port, so a
        // launcher can learn ephemeral ports before peers are known. init() calls
        // it when needed. Throws if the address cannot be bound.
        std::uint16_t bind()
        {
            if (m_state != MachineState::Initializing)
            {
                throw std::runtime_error("Machine::bind: only valid while initializing");
            }
            if (!m_listener.running())
            {
                m_listener.start(m_cfg.host, m_cfg.port);
                // Resolved port, so self-detection in the peer list works for port 0.
                m_cfg.port = m_listener.port();
            }
            return m_listener.port();
        }

        // Replaces the peer list before init().
        void set_peers(PeerList peers)
        {
            if (m_state != MachineState::Initializing || m_initAttempted)
            {
                throw std::runtime_error("Machine::set_peers: only valid before init");
            }
            m_cfg.peers = std::move(peers);
        }

        // Runs the event loop for cfg.runTime (or until request_stop), then
        // shuts down. Calls init() first if needed.
        void run()
        {
            if (m_state == MachineState::Initializing)
            {
                init();
            }
            if (m_state != MachineState::Running)
            {
                throw std::runtime_error(std::string("Machine::run: cannot run from state ") + machine_state_name(m_state));
            }

            using steady = std::chrono::steady_clock;
            const auto start = steady::now();
            const auto period = std::chrono::duration_cast<steady::duration>(std::chrono::duration<double>(1.0 / m_ticksPerSecond));

            while (!m_stopRequested.load() && steady::now() - start < m_cfg.runTime)
            {
                const auto tickStart = steady::now();
                tick();

                const auto elapsed = steady::now() - tickStart;
                if (elapsed < period)
                {
                    std::unique_lock<std::mutex> lk(m_stopMu);
                    m_stopCv.wait_for(lk, period - elapsed, [this]
                                      { return m_stopRequested.load(); });
                }
            }

            shutdown();
        }

        // One event-loop iteration without the rate-holding sleep.
        void tick()
        {
            if (m_state != MachineState::Running)
            {
                throw std::runtime_error(std::string("Machine::tick: not running (") + machine_state_name(m_state) + ")");
            }

            ++m_stats.ticks;
            m_progress = TickProgress{};
            try
            {
                tick_();
            }
            catch (const std::exception &e)
            {
                ++m_stats.tickErrors;
                Logger::instance().logf(LogLevel::Error, m_cfg.id, "tick failed: %s", e.what());
                recover_tick_(e.what());
            }
        }

        // Thread-safe; the event loop observes it at the next tick boundary.
        void request_stop()
        {
            {
                std::lock_guard<std::mutex> lk(m_stopMu);
                m_stopRequested.store(true);
            }
            m_stopCv.notify_all();
        }

        // RUNNING -> SHUTTING_DOWN -> TERMINATED. Idempotent: SHUTDOWN is recorded
        // once, and only if INIT was.
        void shutdown()
        {
            if (m_state == MachineState::Terminated || m_state == MachineState::ShuttingDown)
            {
                return;
            }
            const bool announce = m_state == MachineState::Running;
            m_state = MachineState::ShuttingDown;

            if (announce)
            {
                try
                {
                    emit_(EventType::Shutdown, std::nullopt, std::nullopt);
                }
                catch (const std::exception &e)
                {
                    Logger::instance().logf(LogLevel::Error, m_cfg.id, "could not record SHUTDOWN: %s", e.what());
                }
            }

            for (auto &link : m_links)
            {
                link->close();
            }
            m_links.clear();
            m_listener.stop();
            m_sink->close();

            m_state = MachineState::Terminated;
            Logger::instance().logf(LogLevel::Info, m_cfg.id, "terminated at L=%llu",
                                    static_cast<unsigned long long>(m_clock.value()));
        }

        MachineState state() const noexcept { return m_state; }
        LamportTime clock() const noexcept { return m_clock.value(); }
        std::uint32_t ticks_per_second() const noexcept { return m_ticksPerSecond; }
        std::size_t active_peer_count() const noexcept { return m_links.size(); }
        std::uint16_t listen_port() const noexcept { return m_listener.port(); }
        const Stats &stats() const noexcept { return m_stats; }
        const MachineConfig &config() const noexcept { return m_cfg; }
        const WeightedChoice<Action> &action_table() const noexcept { return m_actions; }

        // Shared with the receive loops; tests may push directly.
        InboundQueue &inbound() noexcept { return m_inbound; }

    private:
        // Each branch marks m_progress before touching the clock so that
        // recover_tick_ records what actually happened.
        void tick_()
        {
            std::size_t remaining = 0;
            if (auto msg = m_inbound.poll(&remaining))
            {
                m_progress.receivedQueueLength = remaining;
                m_clock.tick_receive(msg->senderTimestamp);
                emit_(EventType::Receive, remaining, std::nullopt);
                m_progress.recorded = true;
                ++m_stats.receiveEvents;
                return;
            }

            const Action action = m_actions.pick(m_rng.uniform_range(1, m_actions.total_weight()));
            const LamportTime ts = m_clock.tick_local();
            m_progress.advanced = true;

            if (action == Action::Internal)
            {
                emit_(EventType::Internal, std::nullopt, std::nullopt);
                m_progress.recorded = true;
                ++m_stats.internalEvents;
                return;
            }

            if (m_links.empty())
            {
                emit_(EventType::Internal, std::nullopt, std::string("no active peers for ") + event_type_name(event_type_for(action)));
                m_progress.recorded = true;
                ++m_stats.internalEvents;
                return;
            }

            switch (action)
            {
            case Action::SendOne:
                send_to_(static_cast<std::size_t>(m_rng.uniform_range(0, m_links.size() - 1)), ts);
                break;
            case Action::SendOther:
                send_to_(1 % m_links.size(), ts);
                break;
            case Action::SendAll:
                for (std::size_t i = 0; i < m_links.size(); ++i)
                {
                    send_to_(i, ts);
                }
                break;
            case Action::Internal:
                break;
            }
            prune_closed_links_();

            emit_(event_type_for(action), std::nullopt, std::nullopt);
            m_progress.recorded = true;
            ++m_stats.sendEvents;
        }

        // Writes the record for the clock update the failed tick left behind:
        // the RECEIVE of a message already merged, or a single INTERNAL step.
        void recover_tick_(const char *what)
        {
            if (m_progress.recorded)
            {
                return;
            }
            const std::string note = std::string("tick error: ") + what;
            try
            {
                if (m_progress.receivedQueueLength)
                {
                    ++m_stats.receiveEvents;
                    emit_(EventType::Receive, m_progress.receivedQueueLength, note);
                    return;
                }
                if (!m_progress.advanced)
                {
                    m_clock.tick_local();
                }
                ++m_stats.internalEvents;
                emit_(EventType::Internal, std::nullopt, note);
            }
            catch (const std::exception &e)
            {
                Logger::instance().logf(LogLevel::Error, m_cfg.id, "could not record tick error at L=%llu: %s",
                                        static_cast<unsigned long long>(m_clock.value()), e.what());
            }
        }

        void send_to_(std::size_t idx, LamportTime ts)
        {
            if (m_links[idx]->send(ts, m_cfg.id))
            {
                ++m_stats.messagesSent;
            }
            else
            {
                ++m_stats.sendFailures;
            }
        }

        void prune_closed_links_()
        {
            for (auto it = m_links.begin(); it != m_links.end();)
            {
                if (!(*it)->is_open())
                {
                    Logger::instance().logf(LogLevel::Warn, m_cfg.id, "dropping peer %s from active set",
                                            (*it)->peer().to_string().c_str());
                    ++m_stats.droppedPeers;
                    it = m_links.erase(it);
                    continue;
                }
                ++it;
            }
        }

        void emit_(EventType type, std::optional<std::size_t> queueLen, std::optional<std::string> note)
        {
            EventRecord rec;
            rec.wallClockTime = wall_clock_seconds();
            rec.type = type;
            rec.logicalClock = m_clock.value();
            rec.queueLength = queueLen;
            rec.note = std::move(note);
            m_sink->write(rec);
            Logger::instance().logf(LogLevel::Trace, m_cfg.id, "%s", format_record(rec).c_str());
        }

        MachineConfig m_cfg;
        std::shared_ptr<IRecordSink> m_sink;

        LamportClock m_clock;
        SplitMix64 m_rng;
        WeightedChoice<Action> m_actions;
        std::uint32_t m_ticksPerSecond = 0;

        InboundQueue m_inbound;
        Listener m_listener;
        std::vector<std::unique_ptr<PeerLink>> m_links;

        // How far the current tick got.
        struct TickProgress
        {
            std::optional<std::size_t> receivedQueueLength;
            bool advanced = false;
            bool recorded = false;
        };

        MachineState m_state = MachineState::Initializing;
        bool m_initAttempted = false;
        Stats m_stats{};
        TickProgress m_progress{};

        std::atomic<bool> m_stopRequested{false};
        std::mutex m_stopMu;
        std::condition_variable m_stopCv;
    };
}
