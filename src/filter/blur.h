#pragma once
#include <tinta/render/pixmap.h>

namespace tinta::filter {

// Gaussian blur of a premultiplied image in place, standard deviations in
// pixels. An axis with a zero deviation is left untouched. Deviations of
// 2 and above use three box blurs, smaller ones the exact kernel. Pixels
// outside the image count as transparent.
void gaussian_blur(render::Pixmap& image, float std_dev_x, float std_dev_y);

} // namespace tinta::filter
