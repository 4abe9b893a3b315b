#include <tether/model/document_key.hpp>

#include <algorithm>

#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/functional/hash.hpp>

namespace tether {

namespace {

bool
is_document_path(std::vector<string> const& segments)
{
    return !segments.empty() && segments.size() % 2 == 0
           && std::none_of(
               segments.begin(), segments.end(), [](string const& segment) {
                   return segment.empty();
               });
}

} // namespace

document_key::document_key(std::vector<string> segments)
    : segments_(std::move(segments))
{
    if (!is_document_path(segments_))
    {
        TETHER_THROW(
            invalid_document_key() << document_path_info(this->to_string())
                                   << internal_error_message_info(
                                          "document keys must have an even "
                                          "number of non-empty segments"));
    }
}

document_key
document_key::from_path_string(string const& path)
{
    std::vector<string> segments;
    boost::algorithm::split(
        segments, path, [](char c) { return c == '/'; });
    return document_key(std::move(segments));
}

string const&
document_key::document_id() const
{
    if (segments_.empty())
    {
        TETHER_THROW(
            internal_check_failed() << internal_error_message_info(
                "document_id() called on an empty document_key"));
    }
    return segments_.back();
}

string
document_key::to_string() const
{
    return boost::algorithm::join(segments_, "/");
}

bool
operator==(document_key const& a, document_key const& b)
{
    return a.segments() == b.segments();
}

bool
operator!=(document_key const& a, document_key const& b)
{
    return !(a == b);
}

bool
operator<(document_key const& a, document_key const& b)
{
    return a.segments() < b.segments();
}

std::ostream&
operator<<(std::ostream& s, document_key const& key)
{
    return s << key.to_string();
}

size_t
hash_value(document_key const& key)
{
    return boost::hash_range(key.segments().begin(), key.segments().end());
}

} // namespace tether
