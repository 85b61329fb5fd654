#pragma once

#include <memory>
#include <string>

#include "md/md_types.hpp"
#include "util/feed_channel.hpp"

// A frame the transport could not decode. Reported on the side channel only.
struct FeedErrorEvent {
    std::string symbol; // empty when the frame carried no usable symbol
    std::string message;
};

// A ticker stream only needs a few slots; one channel exists per subscribed symbol.
using UpdateChannel = FeedChannel<TickerUpdate, 64>;
using ErrorChannel  = FeedChannel<FeedErrorEvent, 256>;

// Push side of an exchange: per-symbol ticker subscriptions.
// subscribe() blocks until the exchange acknowledges and returns the channel
// the transport fills for that symbol; throws SubscriptionError.
// unsubscribe() tears the subscription down and closes that channel (exactly once),
// even when the exchange rejects the request; throws SubscriptionError in that case.
// A dropped connection closes every channel.
struct IMarketWs {
    virtual ~IMarketWs() = default;

    virtual std::shared_ptr<UpdateChannel> subscribe(const std::string& symbol) = 0;
    virtual void unsubscribe(const std::string& symbol) = 0;

    // Decode failures for every symbol. Single consumer.
    virtual std::shared_ptr<ErrorChannel> errors() = 0;
};
