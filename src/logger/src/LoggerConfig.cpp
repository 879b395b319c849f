// /////////////////////////////////////////////////////////////////////////////
/// @file LoggerConfig.cpp
/// @brief LoggerConfig::Builder implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rlog/logger/LoggerConfig.hpp>
#include <rlog/core/Assert.hpp>

namespace rlog::logger {

LoggerConfig::Builder& LoggerConfig::Builder::replaySource(const serial::IReplaySource* source) noexcept
{
    replaySource_ = source;
    return *this;
}

LoggerConfig::Builder& LoggerConfig::Builder::addSink(serial::ILogSink* sink)
{
    RLOG_ASSERT(sink != nullptr);
    if (sink != nullptr)
    {
        sinks_.push_back(sink);
    }
    return *this;
}

LoggerConfig::Builder& LoggerConfig::Builder::checkKeyTypes(bool enabled) noexcept
{
    checkKeyTypes_ = enabled;
    return *this;
}

LoggerConfig LoggerConfig::Builder::build() const
{
    LoggerConfig cfg;
    cfg.replaySource_  = replaySource_;
    cfg.sinks_         = sinks_;
    cfg.checkKeyTypes_ = checkKeyTypes_;
    return cfg;
}

} // namespace rlog::logger
