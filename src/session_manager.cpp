#include "wxmcp/session_manager.hpp"
#include "wxmcp/logger.hpp"

#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace wxmcp {

std::string SessionManager::generate_session_id() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;
    uint64_t a = dis(gen), b = dis(gen);
    // Format as UUID v4
    a = (a & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
    b = (b & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    oss << std::setw(8)  << (a >> 32);
    oss << "-" << std::setw(4) << ((a >> 16) & 0xFFFF);
    oss << "-" << std::setw(4) << (a & 0xFFFF);
    oss << "-" << std::setw(4) << (b >> 48);
    oss << "-" << std::setw(12) << (b & 0xFFFFFFFFFFFFull);
    return oss.str();
}

SessionManager::SessionManager(std::shared_ptr<const Dispatcher> dispatcher)
    : dispatcher_(std::move(dispatcher))
    , state_(std::make_shared<State>()) {
    if (!dispatcher_) {
        throw std::invalid_argument("SessionManager requires a dispatcher");
    }
}

SessionManager::~SessionManager() {
    close_all();
}

std::shared_ptr<Session> SessionManager::open(TransportKind kind,
                                              std::shared_ptr<IConnection> connection,
                                              std::string id) {
    if (id.empty()) id = generate_session_id();
    auto session = std::make_shared<Session>(id, kind, std::move(connection), dispatcher_);

    std::shared_ptr<Session> replaced;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        auto it = state_->sessions.find(id);
        if (it != state_->sessions.end()) replaced = it->second;
        state_->sessions[id] = session;
        ++state_->running_workers;
    }
    if (replaced) {
        LOG4CPLUS_WARN(session_logger(), "Session id " << id << " reused, closing the previous session");
        replaced->close();
    }

    std::weak_ptr<State> weak_state = state_;
    session->start([weak_state, raw = session.get()](const std::string& session_id) {
        auto state = weak_state.lock();
        if (!state) return;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            auto it = state->sessions.find(session_id);
            if (it != state->sessions.end() && it->second.get() == raw) {
                state->sessions.erase(it);
            }
            --state->running_workers;
        }
        state->drained_cv.notify_all();
    });

    LOG4CPLUS_INFO(session_logger(), "Session " << id << " opened (" << to_string(kind) << ")");
    return session;
}

void SessionManager::release(const std::string& id) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        auto it = state_->sessions.find(id);
        if (it == state_->sessions.end()) return;
        session = std::move(it->second);
        state_->sessions.erase(it);
    }
    session->close();
    LOG4CPLUS_INFO(session_logger(), "Session " << id << " released");
}

std::shared_ptr<Session> SessionManager::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->sessions.find(id);
    return it == state_->sessions.end() ? nullptr : it->second;
}

size_t SessionManager::size() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->sessions.size();
}

void SessionManager::close_all() {
    std::vector<std::shared_ptr<Session>> sessions;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        for (auto& [id, session] : state_->sessions) {
            sessions.push_back(std::move(session));
        }
        state_->sessions.clear();
    }
    for (auto& session : sessions) {
        session->close();
    }
    if (!sessions.empty()) {
        LOG4CPLUS_INFO(session_logger(), "Closed " << sessions.size() << " session(s)");
    }
}

bool SessionManager::wait_drained(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->drained_cv.wait_for(lock, timeout, [this] {
        return state_->running_workers == 0;
    });
}

} // namespace wxmcp
