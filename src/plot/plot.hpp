#ifndef DIFFEO_PLOT_HPP
#define DIFFEO_PLOT_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include "details/side_by_side.hpp"

namespace Diffeo::Plot {
    using SideBySide = Details::SideBySide;
    using Sink = Details::Sink;
    using RenderOptions = Details::RenderOptions;

    // Sink writing every request as a PNG figure at its save path.
    [[nodiscard]] inline auto FileSink(RenderOptions options = {}) -> Sink {
        return [options](const SideBySide& request) { Details::save(request, options); };
    }
}

#endif // DIFFEO_PLOT_HPP
