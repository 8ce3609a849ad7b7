#ifndef MANIFOLD_LIBRARY_H
#define MANIFOLD_LIBRARY_H

#include "../src/core.hpp"
#include "../src/activation/activation.hpp"
#include "../src/initialization/initialization.hpp"
#include "../src/common/hook.hpp"
#include "../src/layer/layer.hpp"
#include "../src/block/block.hpp"
#include "../src/loss/loss.hpp"
#include "../src/optimizer/optimizer.hpp"
#include "../src/callback/callback.hpp"
#include "../src/mixup/mixup.hpp"

// Public umbrella header.
// -----------------------------------------------------------------------------
//  - Model graph (layers, blocks, interception sites) and the training driver.
//  - Loss and optimizer descriptors, lifecycle callbacks.
//  - Manifold mixup: Mixup::manifold_mixup / Mixup::interleaved_manifold_mixup.
// Everything is header-only; the only dependency is libtorch.

#endif // MANIFOLD_LIBRARY_H
