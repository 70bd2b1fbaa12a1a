#pragma once

#include "preflight/action/core.hpp"
#include "preflight/action/http_types.hpp"
#include "preflight/action/output_slots.hpp"

namespace preflight {
namespace action {

/**
 * Maps a completed transport attempt to exactly one Outcome.
 *
 * Precedence:
 * 1. Response received: 2xx success, 4xx client error, 5xx server error,
 *    any other code unclassified
 * 2. Connection failure that timed out: timeout
 * 3. Any other connection failure: network error
 * 4. Anything else: unclassified
 */
class OutcomeClassifier {
public:
    static Outcome classify(const TransportResult& result);

    // Writes the outcome's data into the bound slots. Response slots are
    // only written when a response was received.
    static void record(const Outcome& outcome, const OutputSlots& slots);

    static void record_response(const ResponseData& response, const OutputSlots& slots);

    static bool is_timeout(const TransportResult& result);

    // Received response of an outcome, or nullptr when none exists
    static const ResponseData* response_of(const Outcome& outcome);

    // Error message of an outcome; empty for success
    static std::string message_of(const Outcome& outcome);

private:
    static Outcome classify_response(const TransportResult& result);
};

} // namespace action
} // namespace preflight
