#ifndef FUSIONML_API_HPP
#define FUSIONML_API_HPP

#include <memory>

#include "fusionml/config.hpp"
#include "fusionml/engine.hpp"
#include "fusionml/logging.hpp"
#include "fusionml/observability.hpp"
#include "fusionml/service.hpp"
#include "fusionml/session.hpp"
#include "fusionml/transport.hpp"

namespace fusionml {

struct ServiceRuntime {
    std::shared_ptr<AnomalyEngine> engine;
    std::shared_ptr<StreamSession> session;
    std::shared_ptr<ServiceLoop> service;
    std::shared_ptr<HealthMonitor> health;
    std::shared_ptr<MetricsExporter> exporter;
};

ServiceRuntime build_service(const ServiceSettings& settings, std::shared_ptr<Transport> transport = nullptr,
                             std::shared_ptr<const EnsembleTrainer> trainer = nullptr);

}  // namespace fusionml

#endif  // FUSIONML_API_HPP
