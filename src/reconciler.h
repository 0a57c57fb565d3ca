#pragma once
#include "core.h"

namespace tsm {

struct ReconcileResult {
    QVector<Element> elements;
    int              patched     = 0;   // extracted elements an override touched
    int              synthesized = 0;   // sidecar-only elements
    Diagnostics      diagnostics;
};

// Merges one page of extracted elements with the page's sidecar overrides.
// Extracted elements keep their order and come first; sidecar-only entries
// follow in override order. Pure: same inputs, equal output.
ReconcileResult reconcile(int page, const QVector<Element>& extracted,
                          const QVector<SidecarOverride>& overrides);

// Field-level patch: only fields present in the override replace values.
Element applyOverride(const Element& extracted, const SidecarOverride& ov);

// Element for an override with nothing extracted under its id.
Element synthesizeElement(const SidecarOverride& ov);

} // namespace tsm
