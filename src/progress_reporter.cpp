// Distributed under the Boost Software License, Version 1.0. (See
// accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
#include "progress_reporter.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/thread/locks.hpp>
#include <vector>

namespace git_migrator {

namespace pt = boost::posix_time;

typedef boost::shared_lock<boost::shared_mutex> read_lock;
typedef boost::unique_lock<boost::shared_mutex> write_lock;

progress_reporter::progress_reporter(std::size_t total)
    : current_(0), total_(total), next_subscriber(0)
{
}

void progress_reporter::start(std::size_t total)
{
    {
        write_lock lock(mutex);
        total_ = total;
        current_ = 0;
        start_time = pt::microsec_clock::universal_time();
    }
    notify();
}

void progress_reporter::start()
{
    {
        write_lock lock(mutex);
        start_time = pt::microsec_clock::universal_time();
    }
    notify();
}

void progress_reporter::set_operation(std::string const& operation)
{
    {
        write_lock lock(mutex);
        operation_ = operation;
    }
    notify();
}

void progress_reporter::set_current(std::size_t current)
{
    {
        write_lock lock(mutex);
        current_ = current;
    }
    notify();
}

void progress_reporter::increment()
{
    {
        write_lock lock(mutex);
        ++current_;
    }
    notify();
}

std::size_t progress_reporter::current() const
{
    read_lock lock(mutex);
    return current_;
}

std::size_t progress_reporter::total() const
{
    read_lock lock(mutex);
    return total_;
}

double progress_reporter::percentage() const
{
    read_lock lock(mutex);
    return snapshot().percentage;
}

std::string progress_reporter::operation() const
{
    read_lock lock(mutex);
    return operation_;
}

pt::time_duration progress_reporter::eta() const
{
    read_lock lock(mutex);
    return snapshot().eta;
}

progress_status progress_reporter::status() const
{
    read_lock lock(mutex);
    return snapshot();
}

progress_status progress_reporter::snapshot() const
{
    progress_status s;
    s.current = current_;
    s.total = total_;
    s.operation = operation_;
    s.start_time = start_time;
    s.percentage = total_ == 0 ? 0.0 : 100.0 * current_ / total_;
    s.eta = pt::seconds(0);

    if (current_ == 0 || start_time.is_not_a_date_time() || current_ >= total_)
        return s;

    pt::time_duration elapsed = pt::microsec_clock::universal_time() - start_time;
    double seconds = elapsed.total_microseconds() / 1e6;
    if (seconds <= 0)
        return s;

    double rate = current_ / seconds;
    s.eta = pt::seconds(static_cast<long>((total_ - current_) / rate));
    return s;
}

progress_reporter::unsubscriber progress_reporter::subscribe(subscriber fn)
{
    std::size_t id;
    {
        write_lock lock(mutex);
        id = next_subscriber++;
        subscribers.emplace(id, std::move(fn));
    }
    return [this, id]()
    {
        write_lock lock(mutex);
        subscribers.erase(id);
    };
}

void progress_reporter::notify()
{
    progress_status s;
    std::vector<subscriber> targets;
    {
        read_lock lock(mutex);
        s = snapshot();
        targets.reserve(subscribers.size());
        for (auto const& entry : subscribers)
            targets.push_back(entry.second);
    }
    for (auto const& fn : targets)
        fn(s);
}

} // namespace git_migrator
