#include "session.h"
#include "config.h"
#include "embedding_provider.h"
#include "llm_client.h"
#include "logger.h"
#include "utils.h"
#include <atomic>
#include <condition_variable>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <thread>

namespace parley {

static std::atomic<bool> g_interrupted{false};

void signal_handler(int signal) {
    (void)signal;
    g_interrupted = true;
}

/**
 * @brief y/N confirmation answered by the next line typed at the prompt
 *
 * The worker thread blocks in confirm() until the input loop hands over
 * a line through answer().
 */
class TerminalConfirmation : public ConfirmationHandler {
public:
    ConfirmationDecision confirm(const ConfirmationRequest& request) override {
        std::unique_lock<std::mutex> lock(mutex_);
        std::cout << "\n[confirm] " << request.tool_name << ": " << request.preview
                  << "\nAllow? [y/N] " << std::flush;
        waiting_ = true;
        answered_ = false;
        cv_.wait(lock, [this] { return answered_ || closed_; });
        waiting_ = false;
        if (closed_ || !accepted_) {
            return ConfirmationDecision::reject();
        }
        return ConfirmationDecision::accept("terminal");
    }

    bool waiting() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return waiting_;
    }

    void answer(const std::string& line) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::string a = utils::to_lower(utils::trim_copy(line));
            accepted_ = (a == "y" || a == "yes");
            answered_ = true;
        }
        cv_.notify_all();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool waiting_ = false;
    bool answered_ = false;
    bool accepted_ = false;
    bool closed_ = false;
};

static void print_stats(const SessionStats& s) {
    std::cout << std::fixed << std::setprecision(2)
              << "cache:   " << s.cache.entries << " entries, hit rate " << s.cache.hit_rate() * 100.0
              << "% (" << s.cache.hits << "/" << (s.cache.hits + s.cache.misses) << "), "
              << s.cache.tokens_saved << " tokens saved, " << s.cache.evictions << " evictions\n"
              << "memory:  user " << s.user.live_records << " (" << s.user.tombstones << " tombstoned"
              << (s.user.index_available ? "" : ", keyword fallback") << "), session "
              << s.session.live_records << ", context " << s.context.live_records << "\n"
              << "history: " << s.history_messages << " messages, " << s.compressions << " compressions\n"
              << "turns:   " << s.turns_completed << ", token scale " << s.token_scale << "\n"
              << "audit:   " << s.audit.total << " write calls (" << s.audit.failed << " failed)\n";
}

/// Prints turn events until the channel closes
static void event_printer(AssistantSession& session) {
    auto events = session.events();
    while (true) {
        auto event = events->pop(100);
        if (!event) {
            if (g_interrupted.exchange(false)) {
                if (session.cancel()) {
                    std::cout << "\n[cancelling]" << std::endl;
                }
            }
            if (events->closed() && events->size() == 0) {
                break;
            }
            continue;
        }

        switch (event->kind) {
            case TurnEventKind::Chunk:
                std::cout << event->text << std::flush;
                break;
            case TurnEventKind::ToolStarted:
                std::cout << "\n[tool] " << event->tool_name << "..." << std::endl;
                break;
            case TurnEventKind::ToolFinished:
                std::cout << "[tool] " << event->tool_name << (event->tool_ok ? " ok" : " failed") << std::endl;
                break;
            case TurnEventKind::Done:
                std::cout << "\n> " << std::flush;
                break;
            case TurnEventKind::Failed:
                std::cout << "\n[error] " << event->error.message
                          << (event->error.retryable ? " (try again)" : "") << "\n> " << std::flush;
                break;
            case TurnEventKind::Cancelled:
                std::cout << "\n[cancelled]\n> " << std::flush;
                break;
            case TurnEventKind::StateChanged:
            case TurnEventKind::Usage:
                break;
        }
    }
}

} // namespace parley

int main(int argc, char* argv[]) {
    parley::Logger::initialize(parley::LogLevel::WARN);

    std::string config_path = argc > 1 ? argv[1] : "config/config.json";
    parley::Config config = parley::Config::load_from_file(config_path);

    parley::Logger::shutdown();
    parley::Logger::initialize(parley::Logger::parse_level(config.logging.level), config.logging.file);

    auto provider = std::make_shared<parley::OllamaProvider>(config.llm);
    auto embedder = parley::make_embedding_provider(config.embedding);
    auto confirmation = std::make_shared<parley::TerminalConfirmation>();

    parley::AssistantSession session(config, provider, embedder, confirmation);
    auto ready = session.initialize();
    if (!ready) {
        std::cerr << "Failed to start: " << ready.error().describe() << std::endl;
        parley::Logger::shutdown();
        return 1;
    }

    std::signal(SIGINT, parley::signal_handler);
    std::signal(SIGTERM, parley::signal_handler);

    std::thread printer(parley::event_printer, std::ref(session));

    std::cout << "parley (" << config.llm.model_name << "). /stats, /cancel, /quit\n> " << std::flush;

    std::string line;
    while (std::getline(std::cin, line)) {
        if (confirmation->waiting()) {
            confirmation->answer(line);
            continue;
        }

        std::string input = parley::utils::trim_copy(line);
        if (input.empty()) {
            std::cout << "> " << std::flush;
            continue;
        }
        if (input == "/quit") {
            break;
        }
        if (input == "/stats") {
            parley::print_stats(session.stats());
            std::cout << "> " << std::flush;
            continue;
        }
        if (input == "/cancel") {
            if (!session.cancel()) {
                std::cout << "> " << std::flush;
            }
            continue;
        }

        auto ticket = session.send(input);
        if (!ticket) {
            std::cout << "[busy] " << ticket.error().message << "\n> " << std::flush;
        }
    }

    confirmation->close();
    session.shutdown();
    if (printer.joinable()) {
        printer.join();
    }

    std::cout << std::endl;
    parley::Logger::shutdown();
    return 0;
}
