#ifndef Diffeo_LIBRARY_H
#define Diffeo_LIBRARY_H

#include "../src/common/config.hpp"
#include "../src/common/log.hpp"
#include "../src/common/save_load.hpp"

#include "../src/warp/warp.hpp"
#include "../src/label/label.hpp"
#include "../src/orientation/orientation.hpp"
#include "../src/loss/loss.hpp"
#include "../src/metric/metric.hpp"
#include "../src/model/model.hpp"
#include "../src/optimizer/optimizer.hpp"
#include "../src/lrscheduler/lrscheduler.hpp"

#include "../src/data/data.hpp"
#include "../src/plot/plot.hpp"
#include "../src/training/trainer.hpp"
#include "../src/inference/inference.hpp"
#include "../src/stitch/stitch.hpp"
#include "../src/evaluation/evaluation.hpp"
#include "../src/run/run.hpp"



// Public umbrella header.
// -----------------------------------------------------------------------------
// Intention:
//  - Re-export the registration pipeline (train, infer, stitch, evaluate) for
//    downstream applications and tools.
//  - Include-only components; implementation lives in header-only modules under
//    src/.

#endif // Diffeo_LIBRARY_H
