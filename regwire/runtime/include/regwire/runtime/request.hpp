#pragma once

#include "regwire/core/cancellation.hpp"

#include <future>

namespace regwire {

// Marker for a request that produces TOutput.
template <typename TOutput> struct request {
    using output_type = TOutput;
};

// Contract discovered by regwire_gen: handles TInput, producing TOutput.
template <typename TInput, typename TOutput> class request_handler {
public:
    using input_type = TInput;
    using output_type = TOutput;

    virtual ~request_handler() = default;

    virtual std::future<TOutput> handle(const TInput& input, const cancel_token& cancel) = 0;
};

} // namespace regwire
