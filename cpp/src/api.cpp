#include "fusionml/api.hpp"

#include "fusionml/websocket_transport.hpp"

namespace fusionml {

ServiceRuntime build_service(const ServiceSettings& settings, std::shared_ptr<Transport> transport,
                             std::shared_ptr<const EnsembleTrainer> trainer) {
    configure_logging(settings.logging);

    auto effective_transport =
        transport ? std::move(transport) : std::make_shared<WebSocketTransport>(settings.stream.connect_timeout_s);
    auto engine = std::make_shared<AnomalyEngine>(settings.detector, std::move(trainer));
    auto session = std::make_shared<StreamSession>(std::move(effective_transport), settings.stream);
    auto health = std::make_shared<HealthMonitor>(settings.metrics.freshness_window_s);
    auto service = std::make_shared<ServiceLoop>(engine, session, settings.service, get_logger("ServiceLoop"),
                                                 health);

    auto exporter = std::make_shared<MetricsExporter>([service]() { return service->metrics(); }, *health);
    if (settings.metrics.enabled) {
        exporter->start(settings.metrics.host, settings.metrics.port);
    }

    return ServiceRuntime{engine, session, service, health, exporter};
}

}  // namespace fusionml
