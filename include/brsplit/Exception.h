#pragma once

#include <Poco/Exception.h>

#include <exception>
#include <string>
#include <vector>

namespace brsplit
{
enum ErrorCodes : int
{
    MismatchClusterIDCode = 1,
    GRPCErrorCode = 2,
    InitClusterIDFailed = 3,
    UpdatePDLeaderFailed = 4,
    RegionUnavailable = 6,
    LogicalError = 7,
    ServerIsBusy = 8,
    NotLeader = 9,
    RegionEpochNotMatch = 10,
    RegionNotFound = 11,
    KeyNotInRegion = 12,
    StaleCommand = 13,
    NoPeer = 14,
    SplitFailed = 15,
    PDLeaderNotFound = 16,
    PlacementRuleError = 17,
    InvalidRange = 18,
    PDServerError = 19
};

class Exception : public Poco::Exception
{
public:
    Exception() = default; /// For deferred initialization.
    explicit Exception(const std::string & msg, int code = 0)
        : Poco::Exception(msg, code)
    {}
    Exception(const std::string & msg, const std::string & arg, int code = 0)
        : Poco::Exception(msg, arg, code)
    {}
    Exception(const std::string & msg, const Exception & exc, int code = 0)
        : Poco::Exception(msg, exc, code)
    {}
    explicit Exception(const Poco::Exception & exc)
        : Poco::Exception(exc.displayText())
    {}

    Exception * clone() const override { return new Exception(*this); }
    void rethrow() const override { throw *this; }

    bool empty() const { return code() == 0 && message().empty(); }
};

/// MultiException keeps every error met during one operation, so the final
/// report shows the whole history instead of the last failure only.
/// code() is the code of the most recent error.
class MultiException : public Exception
{
public:
    MultiException() = default;

    void append(const Exception & e)
    {
        error_list.push_back(e);
        std::string msg;
        for (size_t i = 0; i < error_list.size(); ++i)
        {
            if (i > 0)
                msg += "; ";
            msg += "[" + std::to_string(i) + "] " + error_list[i].displayText();
        }
        Exception::operator=(Exception(msg, e.code()));
    }

    const std::vector<Exception> & errors() const { return error_list; }

    size_t size() const { return error_list.size(); }

    MultiException * clone() const override { return new MultiException(*this); }
    void rethrow() const override { throw *this; }

private:
    std::vector<Exception> error_list;
};

inline std::string getCurrentExceptionMsg(const std::string & prefix_msg)
{
    std::string msg = prefix_msg;
    try
    {
        throw;
    }
    catch (const Exception & e)
    {
        msg += e.message();
    }
    catch (const std::exception & e)
    {
        msg += std::string(e.what());
    }
    catch (...)
    {
        msg += "unknown exception";
    }
    return msg;
}

} // namespace brsplit
