#ifndef TETHER_MODEL_DOCUMENT_HPP
#define TETHER_MODEL_DOCUMENT_HPP

#include <map>
#include <variant>

#include <boost/date_time/posix_time/posix_time_types.hpp>

#include <tether/model/document_key.hpp>
#include <tether/model/types.hpp>

namespace tether {

// the value of a single field within a document
using field_value = std::variant<
    nil_t,
    bool,
    integer,
    double,
    string,
    boost::posix_time::ptime>;

// the contents of a document, by field name
typedef std::map<string, field_value> document_data;

// Estimate how many bytes a value occupies.
// These are the same estimates that the server uses for its size accounting,
// so they're only approximations of the actual memory footprint.
size_t
estimate_byte_size(field_value const& value);

size_t
estimate_byte_size(document_data const& data);

// A maybe_document is what the remote document cache stores for a key.
// It's either a document that was found (and has :data) or a marker that
// says the document is known not to exist at :version.
struct maybe_document
{
    document_key key;

    snapshot_version version = 0;

    // the document's contents - valid iff the document exists
    optional<document_data> data;

    bool
    is_document() const
    {
        return data ? true : false;
    }
};

bool
operator==(maybe_document const& a, maybe_document const& b);
bool
operator!=(maybe_document const& a, maybe_document const& b);

maybe_document
make_document(
    document_key key, snapshot_version version, document_data data);

maybe_document
make_no_document(document_key key, snapshot_version version);

} // namespace tether

#endif
