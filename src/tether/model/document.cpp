#include <tether/model/document.hpp>

namespace tether {

namespace {

struct byte_size_estimator
{
    size_t
    operator()(nil_t) const
    {
        return 4;
    }
    size_t
    operator()(bool) const
    {
        return 4;
    }
    size_t
    operator()(integer) const
    {
        return 8;
    }
    size_t
    operator()(double) const
    {
        return 8;
    }
    size_t
    operator()(string const& s) const
    {
        return s.size();
    }
    size_t
    operator()(boost::posix_time::ptime const&) const
    {
        // seconds + nanoseconds
        return 16;
    }
};

} // namespace

size_t
estimate_byte_size(field_value const& value)
{
    return std::visit(byte_size_estimator(), value);
}

size_t
estimate_byte_size(document_data const& data)
{
    size_t size = 0;
    for (auto const& [name, value] : data)
        size += name.size() + estimate_byte_size(value);
    return size;
}

bool
operator==(maybe_document const& a, maybe_document const& b)
{
    return a.key == b.key && a.version == b.version && a.data == b.data;
}

bool
operator!=(maybe_document const& a, maybe_document const& b)
{
    return !(a == b);
}

maybe_document
make_document(document_key key, snapshot_version version, document_data data)
{
    return maybe_document{std::move(key), version, some(std::move(data))};
}

maybe_document
make_no_document(document_key key, snapshot_version version)
{
    return maybe_document{std::move(key), version, none};
}

} // namespace tether
