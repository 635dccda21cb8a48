// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef GIT_MIGRATOR_GIT_FAST_IMPORT_HPP
# define GIT_MIGRATOR_GIT_FAST_IMPORT_HPP

# include "log.hpp"

# include <boost/process/child.hpp>
# include <boost/process/pipe.hpp>
# include <string>

# include <iostream>

namespace git_migrator {

// I/O manipulator that sends a linefeed character with no translation
inline std::ostream& LF (std::ostream& stream)
{
    stream.rdbuf()->sputc('\n');
    return stream;
}

// A running "git fast-import" writing into the repository at work_dir
struct git_fast_import
{
    explicit git_fast_import(std::string const& work_dir);
    ~git_fast_import();

    git_fast_import(git_fast_import const&) = delete;
    git_fast_import& operator=(git_fast_import const&) = delete;

    template <class T>
    git_fast_import& operator<<(T const& x)
    {
        if (Log::get_level() >= Log::Trace)
            std::cerr << x << std::flush;
        this->cin << x;
        return *this;
    }

    git_fast_import& data(char const* data, std::size_t size);

    // Just writes the header for the 'data' command; you can write
    // the actual data directly to the stream.
    git_fast_import& data_hdr(std::size_t size);

    // Starts a commit on ref_name; identities are "Name <email>"
    git_fast_import& commit(
        std::string const& ref_name,
        std::size_t mark,
        std::string const& author,
        long long epoch,
        std::string const& log_message);

    git_fast_import& from(std::string const& committish);
    git_fast_import& filedelete(std::string const& path);
    git_fast_import& filemodify_hdr(std::string const& path);
    git_fast_import& write_raw(char const* data, std::size_t nbytes);

    // Writes everything out to the pack and refs, and returns once
    // fast-import has done so.
    void checkpoint();

    // SHA-1 of the commit with the given mark
    std::string get_mark(std::size_t mark);

    // Ends the stream and waits for the process.  Throws if it failed.
    void finish();

    bool running() const { return !finished; }

 private:
    std::string readline();
    void send();

    boost::process::opstream cin;
    boost::process::ipstream cout;
    boost::process::child process;
    std::size_t checkpoints;
    bool finished;
};

// A path as fast-import wants it, C-quoted when necessary
std::string fast_import_path(std::string const& path);

} // namespace git_migrator

#endif // GIT_MIGRATOR_GIT_FAST_IMPORT_HPP
