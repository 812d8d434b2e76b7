#pragma once
/** @file  DeliverySink.hpp
 *  @brief Outbound boundary: renders and transports one report payload.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include "protocols/ReportPayload.hpp"

namespace crashwatch {
  namespace io {

    /**
 * @class DeliverySink
 * @brief Mail transport (or anything else) behind a single boolean send.
 *
 *  * One call per report, no retries expected from the caller.
 *  * May throw; the reporter treats a throw like `false`.
 */
    class DeliverySink {
    public:
      virtual ~DeliverySink() = default;

      virtual bool send(const protocols::ReportPayload& payload) = 0;
    };

  } // namespace io
} // namespace crashwatch
