#ifndef REQUESTCOALESCER_HPP
#define REQUESTCOALESCER_HPP

#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

// Single-flight map: at most one outstanding load per key.
//
// The first caller for a key becomes the leader and runs the loader, every
// caller arriving while that load is outstanding follows it and receives the
// same value or the same exception. The map lock is held only to register or
// release a flight; the loader itself always runs unlocked.
template <typename T>
class RequestCoalescer {
public:
    using Loader = std::function<T(const std::string&)>;
    using Commit = std::function<void(const T&)>;

private:
    struct Flight {
        Flight() : result(promise.get_future().share()) {}

        std::promise<T> promise;
        std::shared_future<T> result;
    };
    using FlightPtr = std::shared_ptr<Flight>;

public:
    class Ticket {
    public:
        bool isLeader() const { return leader_; }

    private:
        friend class RequestCoalescer;
        Ticket(FlightPtr flight, bool leader) : flight_(std::move(flight)), leader_(leader) {}

        FlightPtr flight_;
        bool leader_;
    };

    RequestCoalescer() = default;
    RequestCoalescer(const RequestCoalescer&) = delete;
    RequestCoalescer& operator=(const RequestCoalescer&) = delete;

    // Joins the outstanding flight for key, or registers a new one.
    Ticket acquire(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = flights_.find(key);
        if (it != flights_.end()) {
            return Ticket(it->second, false);
        }
        auto flight = std::make_shared<Flight>();
        flights_.emplace(key, flight);
        return Ticket(flight, true);
    }

    // Follower side. Blocks until the leader settles; rethrows its exception.
    T await(const Ticket& ticket) const {
        return ticket.flight_->result.get();
    }

    // Leader side. Runs loader, then releases the flight and (on success, if
    // the flight was not forgotten meanwhile) calls commit, both under the
    // lock, before any follower can observe the result.
    T execute(const std::string& key, const Ticket& ticket, const Loader& loader, const Commit& commit) {
        std::optional<T> value;
        std::exception_ptr failure;
        try {
            value.emplace(loader(key));
        } catch (...) {
            failure = std::current_exception();
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            const bool registered = release(key, ticket.flight_);
            if (!failure && registered) {
                try {
                    commit(*value);
                } catch (...) {
                    failure = std::current_exception();
                }
            }
        }

        if (failure) {
            ticket.flight_->promise.set_exception(failure);
            std::rethrow_exception(failure);
        }
        ticket.flight_->promise.set_value(*value);
        return std::move(*value);
    }

    // Fails a leader ticket that will never be executed.
    void abandon(const std::string& key, const Ticket& ticket, std::exception_ptr error) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            release(key, ticket.flight_);
        }
        ticket.flight_->promise.set_exception(error);
    }

    // Detaches the flight for key: its waiters still get the result, but it
    // is not committed and new callers start a fresh load.
    bool forget(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        return flights_.erase(key) > 0;
    }

    void forgetAll() {
        std::lock_guard<std::mutex> lock(mutex_);
        flights_.clear();
    }

    bool isInFlight(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return flights_.find(key) != flights_.end();
    }

    std::size_t inFlight() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return flights_.size();
    }

private:
    // Caller holds mutex_. Only removes the entry if it is still this flight.
    bool release(const std::string& key, const FlightPtr& flight) {
        auto it = flights_.find(key);
        if (it == flights_.end() || it->second != flight) {
            return false;
        }
        flights_.erase(it);
        return true;
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, FlightPtr> flights_;
};

#endif // REQUESTCOALESCER_HPP
