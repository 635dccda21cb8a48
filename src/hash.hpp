// Distributed under the Boost Software License, Version 1.0. (See
// accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
#ifndef GIT_MIGRATOR_HASH_HPP
# define GIT_MIGRATOR_HASH_HPP

# include <string>

namespace git_migrator {

// Raw digests of the given bytes
std::string sha1(std::string const& data);
std::string sha256(std::string const& data);

// Lowercase hex of the first max_bytes bytes of raw
std::string to_hex(std::string const& raw, std::size_t max_bytes = std::string::npos);

} // namespace git_migrator

#endif // GIT_MIGRATOR_HASH_HPP
