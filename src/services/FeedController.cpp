#include "services/FeedController.hpp"
#include "utils/Logger.hpp"
#include <system_error>
#include <thread>

namespace NewsDesk {

const char* toString(FeedState::Status status) {
    switch (status) {
        case FeedState::Status::Idle: return "idle";
        case FeedState::Status::Loading: return "loading";
        case FeedState::Status::Loaded: return "loaded";
        case FeedState::Status::Error: return "error";
    }
    return "unknown";
}

FeedController::FeedController(NewsService& service, Dispatcher dispatcher)
    : service_(service), dispatcher_(std::move(dispatcher)) {}

FeedController::~FeedController() {
    std::unique_lock<std::mutex> lock(workerMutex_);
    workersDone_.wait(lock, [this] { return activeWorkers_ == 0; });
}

uint64_t FeedController::requestHeadlines(const std::optional<std::string>& category) {
    uint64_t id = beginRequest();
    LOG_DEBUG("Request {}: headlines ({})", id, category ? *category : "all");
    dispatch([this, id, category]() {
        complete(id, service_.fetchHeadlines(category), "Failed to fetch news");
    });
    return id;
}

uint64_t FeedController::requestSearch(const std::string& query) {
    uint64_t id = beginRequest();
    LOG_DEBUG("Request {}: search '{}'", id, query);
    dispatch([this, id, query]() {
        complete(id, service_.search(query), "Failed to search news");
    });
    return id;
}

FeedState FeedController::state() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return state_;
}

int FeedController::subscribe(Listener listener) {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    int token = nextToken_++;
    listeners_[token] = std::move(listener);
    return token;
}

void FeedController::unsubscribe(int token) {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    listeners_.erase(token);
}

uint64_t FeedController::beginRequest() {
    FeedState snapshot;
    uint64_t revision;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        state_ = FeedState();
        state_.status = FeedState::Status::Loading;
        state_.requestId = ++latestRequestId_;
        snapshot = state_;
        revision = ++revision_;
    }
    publish(snapshot, revision);
    return snapshot.requestId;
}

void FeedController::complete(uint64_t requestId, FeedResponse response, const std::string& failureMessage) {
    FeedState snapshot;
    uint64_t revision;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (requestId != latestRequestId_) {
            LOG_DEBUG("Discarding stale response for request {} (latest is {})", requestId, latestRequestId_);
            return;
        }
        FeedState next;
        next.requestId = requestId;
        if (response.success) {
            next.status = FeedState::Status::Loaded;
            next.articles = std::move(response.articles);
        } else {
            next.status = FeedState::Status::Error;
            next.message = failureMessage;
            next.error = response.error;
            LOG_ERROR("Request {} failed: {} ({})", requestId, response.error.message,
                      toString(response.error.kind));
        }
        state_ = std::move(next);
        snapshot = state_;
        revision = ++revision_;
    }
    publish(snapshot, revision);
}

void FeedController::publish(const FeedState& state, uint64_t revision) {
    std::unique_lock<std::mutex> delivery(deliveryMutex_);
    // A newer state was already delivered
    if (revision <= deliveredRevision_) return;
    pending_[revision] = state;
    // Whoever is already delivering, possibly this thread from inside a listener, drains it
    if (delivering_) return;
    delivering_ = true;

    while (!pending_.empty()) {
        auto next = pending_.begin();
        FeedState current = std::move(next->second);
        deliveredRevision_ = next->first;
        pending_.erase(next);
        delivery.unlock();

        std::vector<Listener> listeners;
        {
            std::lock_guard<std::mutex> lock(listenerMutex_);
            for (const auto& entry : listeners_) listeners.push_back(entry.second);
        }
        for (const auto& listener : listeners) listener(current);

        delivery.lock();
    }
    delivering_ = false;
}

void FeedController::dispatch(Task task) {
    if (dispatcher_) {
        dispatcher_(std::move(task));
        return;
    }
    {
        std::lock_guard<std::mutex> lock(workerMutex_);
        ++activeWorkers_;
    }
    try {
        std::thread([this, task = std::move(task)]() {
            task();
            workerFinished();
        }).detach();
    } catch (const std::system_error& e) {
        LOG_ERROR("Cannot start request thread: {}", e.what());
        workerFinished();
        throw;
    }
}

void FeedController::workerFinished() {
    // Nothing may touch the controller after this, the destructor can return
    std::lock_guard<std::mutex> lock(workerMutex_);
    --activeWorkers_;
    workersDone_.notify_all();
}

size_t FeedController::activeWorkers() const {
    std::lock_guard<std::mutex> lock(workerMutex_);
    return activeWorkers_;
}

}
