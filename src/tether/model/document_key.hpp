#ifndef TETHER_MODEL_DOCUMENT_KEY_HPP
#define TETHER_MODEL_DOCUMENT_KEY_HPP

#include <functional>
#include <ostream>
#include <vector>

#include <tether/core/errors.hpp>

namespace tether {

// A document_key identifies a single document. It's the path to the document
// within the database, which alternates between collection IDs and document
// IDs (e.g., "rooms/eros/messages/1"). Keys are immutable once created.
struct document_key
{
    // The default constructor creates an empty key, which doesn't refer to
    // any document but is useful as a placeholder.
    document_key()
    {
    }

    // Create a key from its path segments.
    // Throws invalid_document_key if the segments don't describe a document.
    explicit document_key(std::vector<string> segments);

    // Create a key from a slash-separated path string.
    static document_key
    from_path_string(string const& path);

    std::vector<string> const&
    segments() const
    {
        return segments_;
    }

    bool
    empty() const
    {
        return segments_.empty();
    }

    // the ID of the document itself (i.e., the last path segment)
    string const&
    document_id() const;

    // the slash-separated form of the path
    string
    to_string() const;

 private:
    std::vector<string> segments_;
};

bool
operator==(document_key const& a, document_key const& b);
bool
operator!=(document_key const& a, document_key const& b);
bool
operator<(document_key const& a, document_key const& b);

std::ostream&
operator<<(std::ostream& s, document_key const& key);

size_t
hash_value(document_key const& key);

// This is thrown when a path doesn't have the form of a document path.
TETHER_DEFINE_EXCEPTION(invalid_document_key)
TETHER_DEFINE_ERROR_INFO(string, document_path)

} // namespace tether

namespace std {

template<>
struct hash<tether::document_key>
{
    size_t
    operator()(tether::document_key const& key) const
    {
        return tether::hash_value(key);
    }
};

} // namespace std

#endif
