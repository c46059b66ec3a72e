#include <tinta/normalize/normalizer.h>

#include "converter.h"

namespace tinta::normalize {

std::optional<tree::Tree> normalize(const dom::Document& document, const Options& options) {
    Converter converter(document, options);
    return converter.run();
}

} // namespace tinta::normalize
