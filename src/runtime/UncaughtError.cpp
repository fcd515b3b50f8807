#include "UncaughtError.hpp"

#include <cstdlib>
#include <memory>
#include <typeinfo>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace runtime
{

std::string DemangleTypeName(const char* mangled)
{
    if (mangled == nullptr)
        return "unknown exception";

#if defined(__GNUG__)
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> demangled(abi::__cxa_demangle(mangled, nullptr, nullptr, &status),
                                                     std::free);
    if (status == 0 && demangled)
        return demangled.get();
#endif
    return mangled;
}

UncaughtError DescribeException(const std::exception& e, std::optional<cpptrace::stacktrace> trace)
{
    UncaughtError error;
    error.type_name = DemangleTypeName(typeid(e).name());
    error.message = e.what();
    if (trace && !trace->empty())
        error.trace = std::move(trace);
    return error;
}

UncaughtError DescribeException(std::exception_ptr ep, std::optional<cpptrace::stacktrace> trace)
{
    if (!ep)
    {
        UncaughtError error;
        error.type_name = "std::terminate";
        error.message = "terminate called without an active exception";
        if (trace && !trace->empty())
            error.trace = std::move(trace);
        return error;
    }

    try
    {
        std::rethrow_exception(ep);
    }
    catch (const std::exception& e)
    {
        return DescribeException(e, std::move(trace));
    }
    catch (...)
    {
        UncaughtError error;
#if defined(__GNUG__)
        const std::type_info* type = abi::__cxa_current_exception_type();
        error.type_name = DemangleTypeName(type ? type->name() : nullptr);
#else
        error.type_name = "unknown exception";
#endif
        if (trace && !trace->empty())
            error.trace = std::move(trace);
        return error;
    }
}

} // namespace runtime
