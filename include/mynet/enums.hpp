#ifndef SHELF_HTTPD_MYNET_ENUMS_HPP
#define SHELF_HTTPD_MYNET_ENUMS_HPP

#include <poll.h>

namespace ShelfHttpd::Net {
    enum class PollEvent : short {
        idle = 0x0,
        received = POLLIN,
        hangup = POLLHUP,
        error = POLLERR,
    };

    template <typename ... Evs>
    [[nodiscard]] constexpr auto poll_event_mask(Evs ... events) noexcept -> short {
        return static_cast<short>((static_cast<short>(PollEvent::idle) | ... | static_cast<short>(events)));
    }
}

#endif
