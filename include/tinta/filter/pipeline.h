#pragma once
#include <tinta/core/diagnostics.h>
#include <tinta/filter/types.h>
#include <tinta/geom/transform.h>
#include <tinta/platform/thread_pool.h>
#include <tinta/render/pixmap.h>

namespace tinta::filter {

// Runs `filter` over `layer` in place. `ts` maps the filtered element's
// user space to layer pixels. The result replaces the layer content inside
// the filter region; everything outside it is cleared.
void apply(const Filter& filter, const geom::Transform& ts, render::Pixmap& layer,
           platform::ThreadPool* pool, core::DiagnosticEmitter* diagnostics);

} // namespace tinta::filter
