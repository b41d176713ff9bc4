#pragma once

#include "geoliner/core/types.h"

#include <vector>

namespace geoliner {

class PanelStore;

// Receives the finalized panel list (CAD writer, report generator...).
// Returning false or throwing std::exception reports ExportFailed.
class ExportSink {
public:
    virtual ~ExportSink() = default;
    virtual bool exportPanels(const std::vector<Panel>& panels, const SiteConfig& site) = 0;
};

EngineError exportPanels(ExportSink& sink, const PanelStore& store);

} // namespace geoliner
