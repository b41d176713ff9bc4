#include "geoliner/service/export_sink.h"
#include "geoliner/entity/panel_store.h"
#include "geoliner/core/logging.h"

#include <exception>

namespace geoliner {

EngineError exportPanels(ExportSink& sink, const PanelStore& store) {
    try {
        if (!sink.exportPanels(store.panels(), store.siteConfig())) {
            GEOLINER_LOG_WARN("export sink rejected %zu panels", store.size());
            return EngineError::ExportFailed;
        }
    } catch (const std::exception& e) {
        GEOLINER_LOG_WARN("export sink threw: %s", e.what());
        return EngineError::ExportFailed;
    }
    return EngineError::Ok;
}

} // namespace geoliner
