// Implementation of layer dispatch.

#include "layers/layer_catalog.h"

#include "layers/base_layer.h"
#include "layers/chain_layer.h"
#include "layers/congruence_layer.h"
#include "layers/contextual_layer.h"
#include "layers/meta_layer.h"
#include "layers/unit_layer.h"

namespace calib {

LayerEvaluation evaluateLayer(CanonicalLayer layer, const LayerContext& ctx) {
  switch (layer) {
    case CanonicalLayer::Base:
      return evaluateBaseLayer(ctx);
    case CanonicalLayer::Chain:
      return evaluateChainLayer(ctx);
    case CanonicalLayer::Unit:
      return evaluateUnitLayer(ctx);
    case CanonicalLayer::Question:
    case CanonicalLayer::Dimension:
    case CanonicalLayer::Policy:
      return evaluateContextualLayer(ctx, layer);
    case CanonicalLayer::Congruence:
      return evaluateCongruenceLayer(ctx);
    case CanonicalLayer::Meta:
      return evaluateMetaLayer(ctx);
  }
  return LayerEvaluation::missingEvidence(layer, "layer", "unknown layer");
}

}  // namespace calib
