#include <tether/core/errors.hpp>

#include <tether/model/document_key.hpp>
#include <tether/utilities/testing.hpp>

using namespace tether;

TEST_CASE("error info", "[core][exception]")
{
    invalid_document_key error;
    error << document_path_info("rooms");

    REQUIRE(get_required_error_info<document_path_info>(error) == "rooms");

    try
    {
        get_required_error_info<internal_error_message_info>(error);
        FAIL("no exception thrown");
    }
    catch (missing_error_info& e)
    {
        get_required_error_info<error_info_id_info>(e);
        get_required_error_info<wrapped_exception_diagnostics_info>(e);
    }
}

TEST_CASE("thrown exceptions carry their info", "[core][exception]")
{
    try
    {
        TETHER_THROW(
            failed_precondition()
            << internal_error_message_info("reconfigure me"));
        FAIL("no exception thrown");
    }
    catch (failed_precondition& e)
    {
        REQUIRE(get_error_message(e) == "reconfigure me");
        REQUIRE(get_error_info<stacktrace_info>(e) != nullptr);
        REQUIRE(string(e.what()).find("reconfigure me") != string::npos);
    }
}
