#include "alloc_error.hh"

#include <alloc-core/assert-handler.hh>
#include <alloc-core/assert.hh>

std::string ac::to_string(alloc_error const& error)
{
    switch (error.kind)
    {
    case alloc_error_kind::capacity_overflow:
        return "capacity overflow";
    case alloc_error_kind::allocation_failure:
        return "allocation of " + std::to_string(error.failed_layout.size) + " bytes with alignment "
             + std::to_string(error.failed_layout.alignment) + " failed";
    }

    return "unknown allocation error";
}

[[noreturn]] void ac::capacity_overflow(ac::source_location location)
{
    impl::handle_fatal_error("capacity overflow", "capacity overflow", location);
    AC_BREAK_AND_ABORT();
}

[[noreturn]] void ac::handle_alloc_error(ac::layout failed_layout, ac::source_location location)
{
    impl::handle_fatal_error("allocation failure", ac::to_string(alloc_error::allocation_failure(failed_layout)), location);
    AC_BREAK_AND_ABORT();
}

[[noreturn]] void ac::handle_reserve_error(alloc_error const& error, ac::source_location location)
{
    if (error.is_capacity_overflow())
        ac::capacity_overflow(location);

    ac::handle_alloc_error(error.failed_layout, location);
}

[[noreturn]] void ac::refcount_overflow(ac::source_location location)
{
    impl::handle_fatal_error("reference count overflow", "reference count exceeded its maximum", location);
    AC_BREAK_AND_ABORT();
}
