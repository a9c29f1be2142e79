#ifndef PULSE_MIME_HPP
#define PULSE_MIME_HPP

#include <string>

namespace Pulse {

    constexpr char DEFAULT_MIME_TYPE[] = "application/octet-stream";

    // MIME type for the extension of `filename`, case-insensitive.
    // Unknown or missing extensions map to DEFAULT_MIME_TYPE.
    std::string mime_type_for(const std::string& filename);

} // namespace Pulse

#endif // PULSE_MIME_HPP
