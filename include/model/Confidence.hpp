#pragma once

namespace model {

/*
  Confidence model. Pure functions, no validation: out-of-range factors are
  absorbed by clamping the result to [0,1].

  entity:       base * context * (1 + 0.2*frequency) * (0.8 + 0.2*agreement)
  relationship: min(source, target) * strength * context_support
*/

// base_score: extractor's own score (0..1)
// context_factor: clarity of the surrounding context (0..1)
// frequency_factor: repeated mentions, unbounded >= 0, can only boost
// method_agreement: agreement between extraction methods (0..1), +-20% band
double entity_confidence(double base_score,
                         double context_factor = 1.0,
                         double frequency_factor = 0.0,
                         double method_agreement = 0.0);

// A relationship is never more trustworthy than its weaker endpoint.
double relationship_confidence(double source_confidence,
                               double target_confidence,
                               double relation_strength,
                               double context_support = 1.0);

// [0,1]; NaN maps to 0.
double clamp_confidence(double value);

} // namespace model
