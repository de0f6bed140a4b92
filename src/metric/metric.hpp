#ifndef DIFFEO_METRIC_HPP
#define DIFFEO_METRIC_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include "details/overlap.hpp"
#include "details/aji.hpp"
#include "details/summary.hpp"
#include "details/dispatch.hpp"

namespace Diffeo::Metric {
    using Kind = Details::Kind;
    using Summary = Details::Summary;
    using Confusion = Details::Confusion;

    struct Descriptor {
        Kind kind;
    };

    [[nodiscard]] constexpr auto Make(Kind kind) noexcept -> Descriptor { return Descriptor{kind}; }

    inline constexpr Descriptor Dice{Kind::Dice};
    inline constexpr Descriptor IoU{Kind::IoU};
    inline constexpr Descriptor PixelF1{Kind::PixelF1};
    inline constexpr Descriptor AggregatedJaccard{Kind::AggregatedJaccard};
    inline constexpr Descriptor L1{Kind::L1};
}

#endif // DIFFEO_METRIC_HPP
