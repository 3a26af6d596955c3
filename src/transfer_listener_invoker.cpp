// SPDX-License-Identifier: MIT

// src/transfer_listener_invoker.cpp
#include "src/transfer_listener_invoker.hpp"

#include <cstdio>
#include <exception>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace xfer_pipe {

TransferListenerInvoker::TransferListenerInvoker(
    std::vector<std::shared_ptr<TransferListener>> listeners,
    FailureReporter reporter)
    : reporter_(reporter ? std::move(reporter) : FailureReporter(&ReportToStderr)) {
    listeners_.reserve(listeners.size());
    for (auto& l : listeners) {
        if (l) listeners_.push_back(std::move(l));
    }
}

void TransferListenerInvoker::ReportToStderr(std::string_view message) {
    fmt::print(stderr, "{}\n", message);
}

void TransferListenerInvoker::Report(const std::string& message) const {
    try {
        reporter_(message);
    } catch (const std::exception& e) {
        ReportToStderr(message);
        ReportToStderr(fmt::format("TransferListenerInvoker: failure reporter threw: {}", e.what()));
    } catch (...) {
        ReportToStderr(message);
        ReportToStderr("TransferListenerInvoker: failure reporter threw a non-standard exception");
    }
}

template<typename Fn>
void TransferListenerInvoker::ForEach(std::string_view event, Fn&& fn) const {
    for (std::size_t i = 0; i < listeners_.size(); ++i) {
        std::string failure;
        try {
            fn(*listeners_[i]);
            continue;
        } catch (const std::exception& e) {
            failure = fmt::format(
                "TransferListenerInvoker: listener #{} threw from {}: {}", i, event, e.what());
        } catch (...) {
            failure = fmt::format(
                "TransferListenerInvoker: listener #{} threw a non-standard exception from {}",
                i, event);
        }
        Report(failure);
    }
}

void TransferListenerInvoker::TransferInitiated(const TransferContext& ctx) const {
    ForEach("TransferInitiated", [&](TransferListener& l) { l.TransferInitiated(ctx); });
}

void TransferListenerInvoker::BytesTransferred(const TransferContext& ctx) const {
    ForEach("BytesTransferred", [&](TransferListener& l) { l.BytesTransferred(ctx); });
}

void TransferListenerInvoker::TransferComplete(const TransferContext& ctx) const {
    ForEach("TransferComplete", [&](TransferListener& l) { l.TransferComplete(ctx); });
}

void TransferListenerInvoker::TransferFailed(const TransferFailedContext& ctx) const {
    ForEach("TransferFailed", [&](TransferListener& l) { l.TransferFailed(ctx); });
}

}  // namespace xfer_pipe
