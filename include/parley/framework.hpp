#pragma once

#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "parley/common.hpp"
#include "parley/dispatch.hpp"
#include "parley/edit_tracker.hpp"
#include "parley/error.hpp"
#include "parley/events.hpp"
#include "parley/metrics.hpp"
#include "parley/once_cell.hpp"
#include "parley/options.hpp"
#include "parley/periodic_task.hpp"
#include "parley/platform.hpp"
#include "parley/thread_pool.hpp"

namespace parley {

inline constexpr const char* kVersion = "0.1.0";

// Ties the dispatch pipeline to a platform. Events go in through event() or
// enqueue(); user data is built once by the setup callback on the first
// ready event, and every handler waits for it.
template <typename Data>
class Framework {
 public:
  using Setup = std::function<Data(const Ready&, Platform&)>;

  Framework(Platform& platform, FrameworkOptions<Data> options, Setup setup, std::size_t worker_threads = 4)
      : platform_(platform), options_(std::move(options)), setup_(std::move(setup)), worker_threads_(worker_threads) {}

  ~Framework() { stop(); }

  Framework(const Framework&) = delete;
  Framework& operator=(const Framework&) = delete;

  const FrameworkOptions<Data>& options() const { return options_; }
  // Changes must not race with events being dispatched.
  FrameworkOptions<Data>& options() { return options_; }

  Platform& platform() { return platform_; }

  std::optional<UserId> bot_id() const {
    std::lock_guard<std::mutex> lock(bot_id_mu_);
    return bot_id_;
  }

  // Blocks until setup has produced the user data. Returns nullptr if setup
  // failed or the framework was stopped first.
  const Data* user_data() const { return user_data_.wait(); }

  // Starts the worker pool and, when edit tracking is enabled, the purge
  // task.
  void start() {
    std::lock_guard<std::mutex> lock(lifecycle_mu_);
    if (!pool_) {
      pool_ = std::make_unique<ThreadPool>(worker_threads_);
    }
    if (options_.prefix_options.edit_tracker && !purge_task_) {
      purge_task_ = make_purge_task(options_.prefix_options.edit_tracker);
      purge_task_->start();
    }
  }

  // Cancels the purge task, releases readers still waiting for user data
  // and lets queued events finish.
  void stop() {
    std::unique_ptr<ThreadPool> pool;
    std::unique_ptr<PeriodicTask> purge;
    {
      std::lock_guard<std::mutex> lock(lifecycle_mu_);
      pool = std::move(pool_);
      purge = std::move(purge_task_);
    }
    if (purge) {
      purge->stop();
    }
    user_data_.close();
    for (auto& parked : take_parked()) {
      if (pool) {
        if (!pool->enqueue([this, parked]() { this->event(*parked); })) {
          Logger::log(Logger::Level::kWarn, "Dropping held " + event_name(*parked) + " event");
        }
      } else {
        this->event(*parked);
      }
    }
    if (pool) {
      pool->shutdown();
    }
  }

  // Handles `event` on a pool worker. Falls back to the calling thread when
  // the framework is not started. Events other than ready that arrive before
  // setup has finished are held back until it has, so they never occupy a
  // worker the ready event needs.
  void enqueue(Event event) {
    auto shared = std::make_shared<Event>(std::move(event));
    if (!std::holds_alternative<ReadyEvent>(*shared)) {
      std::lock_guard<std::mutex> lock(parked_mu_);
      if (!setup_finished_) {
        parked_.push_back(std::move(shared));
        return;
      }
    }
    submit(std::move(shared));
  }

  void wait_idle() {
    ThreadPool* pool = nullptr;
    {
      std::lock_guard<std::mutex> lock(lifecycle_mu_);
      pool = pool_.get();
    }
    if (pool) {
      pool->wait_idle();
    }
  }

  // Runs the whole pipeline for one event on the calling thread. Before the
  // first ready event this blocks until setup has finished; use enqueue()
  // when events may arrive out of order.
  void event(const Event& event) {
    metrics().inc("events." + event_name(event));
    platform_.observe(event);

    std::visit(
        [this](const auto& e) {
          using T = std::decay_t<decltype(e)>;
          if constexpr (std::is_same_v<T, ReadyEvent>) {
            on_ready(e.ready);
          } else if constexpr (std::is_same_v<T, MessageCreateEvent>) {
            on_message(e.message, false);
          } else if constexpr (std::is_same_v<T, MessageUpdateEvent>) {
            on_message_update(e.update);
          } else if constexpr (std::is_same_v<T, MessageDeleteEvent>) {
            on_message_delete(e);
          } else if constexpr (std::is_same_v<T, InteractionCreateEvent>) {
            on_interaction(e.interaction);
          }
        },
        event);

    // After ready handling, so waiting for data here cannot block the setup.
    if (!options_.listener) {
      return;
    }
    const Data* data = user_data_.wait();
    if (!data) {
      Logger::log(Logger::Level::kWarn, "Skipping listener for " + event_name(event) + ": user data unavailable");
      return;
    }
    try {
      options_.listener(event, platform_, *data);
    } catch (...) {
      report_error(options_, std::current_exception(), ErrorContext<Data>(ListenerErrorContext{event}));
    }
  }

 private:
  void on_ready(const Ready& ready) {
    {
      std::lock_guard<std::mutex> lock(bot_id_mu_);
      bot_id_ = ready.user.id;
    }

    Setup setup;
    {
      std::lock_guard<std::mutex> lock(setup_mu_);
      setup = std::move(setup_);
      setup_ = nullptr;
    }
    if (!setup) {
      Logger::log(Logger::Level::kDebug, "Discarding duplicate ready event");
      return;
    }

    try {
      if (user_data_.set(setup(ready, platform_))) {
        Logger::log(Logger::Level::kInfo, "Logged in as " + ready.user.name + ", user data ready");
      } else {
        Logger::log(Logger::Level::kWarn, "User data built after shutdown, discarding it");
      }
    } catch (...) {
      const std::exception_ptr error = std::current_exception();
      user_data_.close();
      report_error(options_, error, ErrorContext<Data>(SetupErrorContext{ready}));
    }

    for (auto& parked : take_parked()) {
      submit(std::move(parked));
    }
  }

  // Marks setup as finished and hands back the events held until then, in
  // arrival order.
  std::vector<std::shared_ptr<Event>> take_parked() {
    std::lock_guard<std::mutex> lock(parked_mu_);
    setup_finished_ = true;
    std::vector<std::shared_ptr<Event>> out;
    out.swap(parked_);
    return out;
  }

  // Queues `event` on the pool, or runs it here when there is none.
  void submit(std::shared_ptr<Event> event) {
    {
      std::lock_guard<std::mutex> lock(lifecycle_mu_);
      if (pool_) {
        if (!pool_->enqueue([this, event]() { this->event(*event); })) {
          Logger::log(Logger::Level::kWarn, "Dropping " + event_name(*event) + " event: framework is stopping");
        }
        return;
      }
    }
    this->event(*event);
  }

  void on_message(const Message& msg, bool triggered_by_edit) {
    const Data* data = user_data_.wait();
    if (!data) {
      Logger::log(Logger::Level::kWarn, "Ignoring message " + std::to_string(msg.id) + ": user data unavailable");
      return;
    }
    const DispatchOutcome outcome = dispatch_message(platform_, options_, msg, triggered_by_edit, bot_id(), *data);
    Logger::log(Logger::Level::kDebug,
                "Message " + std::to_string(msg.id) + " dispatch: " + outcome_name(outcome));
  }

  void on_message_update(const MessageUpdate& update) {
    const auto& tracker = options_.prefix_options.edit_tracker;
    if (!tracker) {
      return;
    }
    const Message msg = tracker->apply_update(update);
    on_message(msg, true);
  }

  void on_message_delete(const MessageDeleteEvent& e) {
    const auto& tracker = options_.prefix_options.edit_tracker;
    if (!tracker) {
      return;
    }
    const std::optional<Message> response = tracker->take_response(e.message_id);
    if (!response) {
      return;
    }
    try {
      platform_.delete_message(response->channel_id, response->id);
    } catch (const std::exception& ex) {
      Logger::log(Logger::Level::kWarn,
                  std::string("Couldn't delete bot response when user deleted message: ") + ex.what());
    }
  }

  void on_interaction(const Interaction& interaction) {
    if (interaction.kind != InteractionKind::kApplicationCommand) {
      return;
    }
    const Data* data = user_data_.wait();
    if (!data) {
      Logger::log(Logger::Level::kWarn, "Ignoring interaction " + std::to_string(interaction.id) +
                                            ": user data unavailable");
      return;
    }
    dispatch_interaction(platform_, options_, interaction, *data);
  }

  Platform& platform_;
  FrameworkOptions<Data> options_;

  std::mutex setup_mu_;
  Setup setup_;
  WriteOnceCell<Data> user_data_;

  mutable std::mutex bot_id_mu_;
  std::optional<UserId> bot_id_;

  std::mutex parked_mu_;
  bool setup_finished_{false};
  std::vector<std::shared_ptr<Event>> parked_;

  std::size_t worker_threads_;
  std::mutex lifecycle_mu_;
  std::unique_ptr<ThreadPool> pool_;
  std::unique_ptr<PeriodicTask> purge_task_;
};

}  // namespace parley
