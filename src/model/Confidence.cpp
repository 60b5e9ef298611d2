#include "model/Confidence.hpp"

#include <algorithm>
#include <cmath>

namespace model {

double clamp_confidence(double value) {
    if (std::isnan(value)) return 0.0;
    return std::min(1.0, std::max(0.0, value));
}

double entity_confidence(double base_score,
                         double context_factor,
                         double frequency_factor,
                         double method_agreement) {
    double c = base_score * context_factor * (1.0 + 0.2 * frequency_factor);
    c *= (0.8 + 0.2 * method_agreement);
    return clamp_confidence(c);
}

double relationship_confidence(double source_confidence,
                               double target_confidence,
                               double relation_strength,
                               double context_support) {
    double weakest = std::min(source_confidence, target_confidence);
    return clamp_confidence(weakest * relation_strength * context_support);
}

} // namespace model
