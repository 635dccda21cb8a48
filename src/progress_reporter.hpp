// Distributed under the Boost Software License, Version 1.0. (See
// accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
#ifndef GIT_MIGRATOR_PROGRESS_REPORTER_HPP
# define GIT_MIGRATOR_PROGRESS_REPORTER_HPP

# include <boost/date_time/posix_time/posix_time_types.hpp>
# include <boost/thread/shared_mutex.hpp>
# include <functional>
# include <map>
# include <string>

namespace git_migrator {

// A consistent snapshot of a progress_reporter
struct progress_status
{
    std::size_t current;
    std::size_t total;
    double percentage;
    std::string operation;
    boost::posix_time::time_duration eta;
    boost::posix_time::ptime start_time;
};

// Counts processed commits and publishes the current operation.  Only
// the thread running a migration mutates it; any number of threads may
// read it or subscribe to it.  Subscribers are invoked synchronously on
// the mutating thread, after the lock is released.
struct progress_reporter
{
    typedef std::function<void(progress_status const&)> subscriber;
    typedef std::function<void()> unsubscriber;

    explicit progress_reporter(std::size_t total = 0);

    // Resets the counter for a run over total items and starts the clock
    void start(std::size_t total);
    void start();

    void set_operation(std::string const& operation);
    void set_current(std::size_t current);
    void increment();

    std::size_t current() const;
    std::size_t total() const;
    double percentage() const;
    std::string operation() const;
    boost::posix_time::time_duration eta() const;
    progress_status status() const;

    // The returned function removes the subscriber again
    unsubscriber subscribe(subscriber fn);

 private:
    progress_status snapshot() const;   // caller holds the lock
    void notify();

    mutable boost::shared_mutex mutex;
    std::size_t current_;
    std::size_t total_;
    std::string operation_;
    boost::posix_time::ptime start_time;
    std::map<std::size_t, subscriber> subscribers;
    std::size_t next_subscriber;
};

} // namespace git_migrator

#endif // GIT_MIGRATOR_PROGRESS_REPORTER_HPP
