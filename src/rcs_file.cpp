// Distributed under the Boost Software License, Version 1.0. (See
// accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
#include "rcs_file.hpp"

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/lexical_cast.hpp>
#include <fstream>
#include <iterator>
#include <set>
#include <sstream>
#include <stdexcept>

namespace git_migrator {

namespace pt = boost::posix_time;

namespace {

enum class token_kind { word, string, colon, semicolon, end };

struct token
{
    token_kind kind;
    std::string value;
    std::size_t line;
};

// Splits RCS text into words, @-strings, colons and semicolons
struct rcs_lexer
{
    rcs_lexer(std::string const& text, std::string const& name)
        : text(text), name(name), pos(0), line(1), peeked(false)
    {
    }

    token const& peek()
    {
        if (!peeked)
        {
            lookahead = scan();
            peeked = true;
        }
        return lookahead;
    }

    token next()
    {
        peek();
        peeked = false;
        return lookahead;
    }

 private:
    static bool is_space(char c)
    {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
    }

    token scan()
    {
        while (pos < text.size() && is_space(text[pos]))
        {
            if (text[pos++] == '\n')
                ++line;
        }

        token t;
        t.line = line;
        if (pos == text.size())
        {
            t.kind = token_kind::end;
            return t;
        }

        char c = text[pos];
        if (c == ';' || c == ':')
        {
            t.kind = c == ';' ? token_kind::semicolon : token_kind::colon;
            t.value = c;
            ++pos;
            return t;
        }

        if (c == '@')
        {
            // "@@" stands for a single '@'
            t.kind = token_kind::string;
            for (++pos; ; ++pos)
            {
                if (pos == text.size())
                    throw rcs_parse_error(name, t.line, "unterminated string");
                if (text[pos] == '@')
                {
                    if (pos + 1 < text.size() && text[pos + 1] == '@')
                    {
                        t.value += '@';
                        ++pos;
                        continue;
                    }
                    ++pos;
                    break;
                }
                if (text[pos] == '\n')
                    ++line;
                t.value += text[pos];
            }
            return t;
        }

        t.kind = token_kind::word;
        while (pos < text.size() && !is_space(text[pos])
               && text[pos] != ';' && text[pos] != ':' && text[pos] != '@')
        {
            t.value += text[pos++];
        }
        return t;
    }

    std::string const& text;
    std::string name;
    std::size_t pos;
    std::size_t line;
    token lookahead;
    bool peeked;
};

bool is_number(std::string const& s)
{
    if (s.empty() || s[0] < '0' || s[0] > '9')
        return false;
    for (char c : s)
    {
        if ((c < '0' || c > '9') && c != '.')
            return false;
    }
    return true;
}

struct rcs_parser
{
    rcs_parser(std::string const& text, std::string const& name)
        : lex(text, name), name(name)
    {
    }

    rcs_file parse()
    {
        admin();
        deltas();
        desc();
        deltatexts();
        return result;
    }

 private:
    void fail(token const& t, std::string const& message)
    {
        throw rcs_parse_error(name, t.line, message);
    }

    token expect(token_kind kind, char const* what)
    {
        token t = lex.next();
        if (t.kind != kind)
            fail(t, std::string("expected ") + what);
        return t;
    }

    // At the start of a phrase that is not a revision number or "desc"
    bool at_phrase()
    {
        token const& t = lex.peek();
        return t.kind == token_kind::word && !is_number(t.value) && t.value != "desc";
    }

    // Everything up to the terminating semicolon, which is consumed
    std::vector<token> values()
    {
        std::vector<token> result;
        for (;;)
        {
            token t = lex.next();
            if (t.kind == token_kind::semicolon)
                return result;
            if (t.kind == token_kind::end)
                fail(t, "unexpected end of file, expected ';'");
            result.push_back(t);
        }
    }

    std::string single(std::vector<token> const& v, token const& key)
    {
        if (v.size() > 1)
            fail(key, "too many values for '" + key.value + "'");
        return v.empty() ? std::string() : v[0].value;
    }

    // The sym:num pairs of the symbols and locks phrases
    std::vector<std::pair<std::string, std::string> >
    pairs(std::vector<token> const& v, token const& key)
    {
        std::vector<std::pair<std::string, std::string> > result;
        for (std::size_t i = 0; i < v.size(); i += 3)
        {
            if (i + 2 >= v.size() || v[i].kind != token_kind::word
                || v[i + 1].kind != token_kind::colon || v[i + 2].kind != token_kind::word)
                fail(key, "malformed '" + key.value + "' list");
            result.push_back(std::make_pair(v[i].value, v[i + 2].value));
        }
        return result;
    }

    void admin()
    {
        token const& first = lex.peek();
        if (first.kind != token_kind::word || first.value != "head")
            fail(first, "not an RCS file, expected 'head'");

        while (at_phrase())
        {
            token key = lex.next();
            std::vector<token> v = values();
            if (key.value == "head")
                result.head = single(v, key);
            else if (key.value == "branch")
                result.branch = single(v, key);
            else if (key.value == "access")
            {
                for (auto const& t : v)
                    result.access.push_back(t.value);
            }
            else if (key.value == "symbols")
                result.symbols = pairs(v, key);
            else if (key.value == "locks")
            {
                for (auto const& p : pairs(v, key))
                    result.locks[p.first] = p.second;
            }
            else if (key.value == "strict")
                result.strict = true;
            else if (key.value == "comment")
                result.comment = single(v, key);
            else if (key.value == "expand")
                result.expand = single(v, key);
        }
    }

    void deltas()
    {
        while (lex.peek().kind == token_kind::word && is_number(lex.peek().value))
        {
            rcs_delta d;
            d.revision = lex.next().value;
            while (at_phrase())
            {
                token key = lex.next();
                std::vector<token> v = values();
                if (key.value == "date")
                {
                    try
                    {
                        d.date = parse_rcs_date(single(v, key));
                    }
                    catch (std::runtime_error const& e)
                    {
                        fail(key, e.what());
                    }
                }
                else if (key.value == "author")
                    d.author = single(v, key);
                else if (key.value == "state")
                    d.state = single(v, key);
                else if (key.value == "branches")
                {
                    for (auto const& t : v)
                        d.branches.push_back(t.value);
                }
                else if (key.value == "next")
                    d.next = single(v, key);
            }
            result.delta_order.push_back(d.revision);
            result.deltas[d.revision] = d;
        }
    }

    void desc()
    {
        token key = expect(token_kind::word, "'desc'");
        if (key.value != "desc")
            fail(key, "expected 'desc', found '" + key.value + "'");
        result.description = expect(token_kind::string, "description string").value;
    }

    void deltatexts()
    {
        while (lex.peek().kind != token_kind::end)
        {
            token rev = expect(token_kind::word, "revision number");
            auto found = result.deltas.find(rev.value);
            if (found == result.deltas.end())
                fail(rev, "text for unknown revision " + rev.value);
            rcs_delta& d = found->second;

            for (;;)
            {
                token key = expect(token_kind::word, "'log' or 'text'");
                if (key.value == "log")
                    d.log = expect(token_kind::string, "log string").value;
                else if (key.value == "text")
                {
                    d.text = expect(token_kind::string, "text string").value;
                    break;
                }
                else
                    values();
            }
        }
    }

    rcs_lexer lex;
    std::string name;
    rcs_file result;
};

// Lines of text, each keeping its terminator
std::vector<std::string> split_lines(std::string const& text)
{
    std::vector<std::string> lines;
    std::string::size_type start = 0;
    while (start < text.size())
    {
        std::string::size_type end = text.find('\n', start);
        if (end == std::string::npos)
        {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start + 1));
        start = end + 1;
    }
    return lines;
}

} // unnamed namespace

rcs_delta const& rcs_file::delta(std::string const& revision) const
{
    auto found = deltas.find(revision);
    if (found == deltas.end())
        throw std::runtime_error("no delta for revision " + revision);
    return found->second;
}

std::vector<std::string> rcs_file::trunk() const
{
    std::vector<std::string> result;
    std::set<std::string> seen;
    for (std::string rev = head; !rev.empty(); rev = delta(rev).next)
    {
        if (!seen.insert(rev).second)
            throw std::runtime_error("revision " + rev + " occurs twice on the trunk");
        result.push_back(rev);
    }
    return result;
}

std::map<std::string, std::string> rcs_file::trunk_texts() const
{
    std::map<std::string, std::string> texts;
    std::string text;
    bool first = true;
    for (auto const& rev : trunk())
    {
        text = first ? delta(rev).text : apply_rcs_diff(text, delta(rev).text);
        first = false;
        texts[rev] = text;
    }
    return texts;
}

rcs_file parse_rcs(std::istream& in, std::string const& name)
{
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return rcs_parser(text, name).parse();
}

rcs_file read_rcs_file(std::string const& path)
{
    std::ifstream file(path.c_str(), std::ios::binary);
    if (!file)
        throw std::runtime_error("cannot open " + path);
    return parse_rcs(file, path);
}

pt::ptime parse_rcs_date(std::string const& text)
{
    std::vector<std::string> parts;
    boost::algorithm::split(parts, text, boost::algorithm::is_any_of("."));
    if (parts.size() != 6)
        throw std::runtime_error("malformed date '" + text + "'");

    int f[6];
    try
    {
        for (int i = 0; i < 6; ++i)
            f[i] = boost::lexical_cast<int>(parts[i]);
    }
    catch (boost::bad_lexical_cast const&)
    {
        throw std::runtime_error("malformed date '" + text + "'");
    }
    if (f[0] < 100)
        f[0] += 1900;

    if (f[3] < 0 || f[3] > 23 || f[4] < 0 || f[4] > 59 || f[5] < 0 || f[5] > 60)
        throw std::runtime_error("malformed date '" + text + "'");

    try
    {
        return pt::ptime(
            boost::gregorian::date(f[0], f[1], f[2]),
            pt::hours(f[3]) + pt::minutes(f[4]) + pt::seconds(f[5]));
    }
    catch (std::out_of_range const&)
    {
        // boost::gregorian::bad_year, bad_month or bad_day_of_month
        throw std::runtime_error("malformed date '" + text + "'");
    }
}

std::string apply_rcs_diff(std::string const& source, std::string const& diff)
{
    std::vector<std::string> const src = split_lines(source);
    std::vector<std::string> const cmds = split_lines(diff);
    std::string result;
    std::size_t cursor = 0;

    for (std::size_t i = 0; i < cmds.size(); )
    {
        std::string const& directive = cmds[i++];
        char code = directive[0];
        std::size_t at = 0, count = 0;
        std::istringstream args(directive.substr(1));
        if (!(args >> at >> count) || (code != 'a' && code != 'd'))
            throw std::runtime_error("illformed diff directive '" + directive + "'");

        if (code == 'a')
        {
            // "aN M": copy source up to line N, then M lines of the diff
            if (at < cursor || at > src.size())
                throw std::runtime_error("diff directive '" + directive + "' out of range");
            while (cursor < at)
                result += src[cursor++];
            if (i + count > cmds.size())
                throw std::runtime_error("diff directive '" + directive + "' runs past the end");
            for (std::size_t n = 0; n < count; ++n)
                result += cmds[i++];
        }
        else
        {
            // "dN M": copy source up to line N-1, then skip M lines
            if (at == 0 || at - 1 < cursor || at - 1 + count > src.size())
                throw std::runtime_error("diff directive '" + directive + "' out of range");
            while (cursor < at - 1)
                result += src[cursor++];
            cursor += count;
        }
    }
    while (cursor < src.size())
        result += src[cursor++];
    return result;
}

bool is_branch_number(std::string const& revision)
{
    std::vector<std::string> parts;
    boost::algorithm::split(parts, revision, boost::algorithm::is_any_of("."));
    if (parts.size() % 2 == 1)
        return true;
    return parts.size() >= 4 && parts[parts.size() - 2] == "0";
}

} // namespace git_migrator
