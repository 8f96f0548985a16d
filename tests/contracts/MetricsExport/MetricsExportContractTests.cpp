#include <gtest/gtest.h>

#include <sys/socket.h>

#include <chrono>
#include <memory>
#include <string>

#include "BaseContractTest.h"
#include "mirrorcast/net/SocketUtil.h"
#include "mirrorcast/telemetry/MetricsExporter.h"
#include "mirrorcast/telemetry/MetricsHTTPServer.h"
#include "../ContractRegistryEnvironment.h"

namespace mirrorcast::tests::contracts {

using mirrorcast::tests::RegisterExpectedDomainCoverage;

const bool kRegisterCoverage = []() {
  RegisterExpectedDomainCoverage("MetricsExport",
                                 {"MET_001", "MET_002", "MET_003", "MET_004", "MET_005"});
  return true;
}();

namespace {

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

std::string FetchOverHttp(uint16_t port, const std::string& path) {
  std::string error;
  int fd = net::ConnectTcp("127.0.0.1", port, 1'000, &error);
  if (fd == net::kInvalidSocket) {
    return "connect failed: " + error;
  }
  const std::string request = "GET " + path + " HTTP/1.1\r\nHost: localhost\r\n\r\n";
  std::string response;
  if (net::SendAll(fd, request.data(), request.size())) {
    net::SetReceiveTimeout(fd, 2'000);
    char buffer[1024];
    while (true) {
      const ssize_t n = recv(fd, buffer, sizeof(buffer), 0);
      if (n <= 0) {
        break;
      }
      response.append(buffer, static_cast<std::size_t>(n));
    }
  }
  net::CloseSocket(fd);
  return response;
}

}  // namespace

class MetricsExportContractTest : public BaseContractTest {
 protected:
  [[nodiscard]] std::string DomainName() const override { return "MetricsExport"; }

  [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override {
    return {"MET_001", "MET_002", "MET_003", "MET_004", "MET_005"};
  }
};

TEST_F(MetricsExportContractTest, MET_001_SubmitWhileStoppedAppliesImmediately) {
  telemetry::MetricsExporter exporter(0, /*enable_http=*/false);

  telemetry::HostMetrics host;
  host.sessions = 2;
  host.frames_sent = 40;
  EXPECT_TRUE(exporter.SubmitHostMetrics(host));

  auto snapshot = exporter.SnapshotForTest();
  ASSERT_TRUE(snapshot.host.has_value());
  EXPECT_EQ(snapshot.host->sessions, 2u);
  EXPECT_EQ(snapshot.host->frames_sent, 40u);
  EXPECT_FALSE(snapshot.viewer.has_value());
  EXPECT_EQ(snapshot.queue_overflow_total, 0u);
}

TEST_F(MetricsExportContractTest, MET_002_WorkerDrainsSubmittedSnapshots) {
  telemetry::MetricsExporter exporter(0, /*enable_http=*/false);
  ASSERT_TRUE(exporter.Start(/*start_http_server=*/false));
  EXPECT_TRUE(exporter.IsRunning());

  constexpr int kIterations = 100;
  for (int i = 1; i <= kIterations; ++i) {
    telemetry::ViewerMetrics viewer;
    viewer.pairing_phase = control::PairingPhase::kPaired;
    viewer.frames_completed = static_cast<uint64_t>(i);
    EXPECT_TRUE(exporter.SubmitViewerMetrics(viewer));
  }

  ASSERT_TRUE(exporter.WaitUntilDrainedForTest(std::chrono::milliseconds(1'000)));

  auto snapshot = exporter.SnapshotForTest();
  ASSERT_TRUE(snapshot.viewer.has_value());
  EXPECT_EQ(snapshot.viewer->frames_completed, static_cast<uint64_t>(kIterations));
  EXPECT_EQ(snapshot.queue_overflow_total, 0u);

  exporter.Stop();
  EXPECT_FALSE(exporter.IsRunning());
}

TEST_F(MetricsExportContractTest, MET_003_TextExposesHostAndViewerFamilies) {
  telemetry::MetricsExporter exporter(0, /*enable_http=*/false);

  std::string text = exporter.GenerateMetricsText();
  EXPECT_TRUE(Contains(text, "mirrorcast_metrics_overflow_total 0\n"));
  EXPECT_FALSE(Contains(text, "mirrorcast_host_"));
  EXPECT_FALSE(Contains(text, "mirrorcast_viewer_"));

  telemetry::HostMetrics host;
  host.sessions = 1;
  host.broadcast_on = true;
  host.frames_unsent = 7;
  exporter.SubmitHostMetrics(host);

  telemetry::ViewerMetrics viewer;
  viewer.pairing_phase = control::PairingPhase::kWaitingAcceptance;
  viewer.frames_dropped = 3;
  exporter.SubmitViewerMetrics(viewer);

  text = exporter.GenerateMetricsText();
  EXPECT_TRUE(Contains(text, "# TYPE mirrorcast_host_sessions gauge\n"));
  EXPECT_TRUE(Contains(text, "mirrorcast_host_sessions 1\n"));
  EXPECT_TRUE(Contains(text, "mirrorcast_host_broadcast_on 1\n"));
  EXPECT_TRUE(Contains(text, "mirrorcast_host_relay_armed 0\n"));
  EXPECT_TRUE(Contains(text, "# TYPE mirrorcast_host_frames_unsent_total counter\n"));
  EXPECT_TRUE(Contains(text, "mirrorcast_host_frames_unsent_total 7\n"));

  EXPECT_TRUE(Contains(text, "mirrorcast_viewer_pairing_state{state=\"idle\"} 0\n"));
  EXPECT_TRUE(
      Contains(text, "mirrorcast_viewer_pairing_state{state=\"waiting_acceptance\"} 1\n"));
  EXPECT_TRUE(Contains(text, "mirrorcast_viewer_pairing_state{state=\"paired\"} 0\n"));
  EXPECT_TRUE(Contains(text, "mirrorcast_viewer_frames_dropped_total 3\n"));
}

TEST_F(MetricsExportContractTest, MET_004_HttpRoutesAndRequestParsing) {
  EXPECT_EQ(telemetry::MetricsHTTPServer::ParseRequestPath("GET /metrics HTTP/1.1\r\n\r\n"),
            "/metrics");
  EXPECT_EQ(telemetry::MetricsHTTPServer::ParseRequestPath("GET / HTTP/1.0\r\n"), "/");
  EXPECT_EQ(telemetry::MetricsHTTPServer::ParseRequestPath("garbage"), "/");

  telemetry::MetricsHTTPServer server(0);
  server.SetMetricsCallback([]() { return std::string("mirrorcast_up 1\n"); });

  const std::string metrics = server.GenerateResponse("/metrics");
  EXPECT_EQ(metrics.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
  EXPECT_TRUE(Contains(metrics, "Content-Type: text/plain; version=0.0.4; charset=utf-8\r\n"));
  EXPECT_TRUE(Contains(metrics, "Content-Length: 16\r\n"));
  EXPECT_TRUE(Contains(metrics, "\r\n\r\nmirrorcast_up 1\n"));

  const std::string index = server.GenerateResponse("/");
  EXPECT_TRUE(Contains(index, "Metrics available at: /metrics"));

  const std::string missing = server.GenerateResponse("/nope");
  EXPECT_EQ(missing.rfind("HTTP/1.1 404 Not Found\r\n", 0), 0u);
}

TEST_F(MetricsExportContractTest, MET_005_ServesMetricsOnEphemeralPort) {
  telemetry::MetricsExporter exporter(0, /*enable_http=*/true);
  ASSERT_TRUE(exporter.Start());
  ASSERT_GT(exporter.port(), 0);

  telemetry::HostMetrics host;
  host.datagrams_sent = 12;
  ASSERT_TRUE(exporter.SubmitHostMetrics(host));
  ASSERT_TRUE(exporter.WaitUntilDrainedForTest(std::chrono::milliseconds(1'000)));

  const std::string response = FetchOverHttp(static_cast<uint16_t>(exporter.port()), "/metrics");
  EXPECT_EQ(response.rfind("HTTP/1.1 200 OK\r\n", 0), 0u) << response;
  EXPECT_TRUE(Contains(response, "mirrorcast_host_datagrams_sent_total 12\n"));

  exporter.Stop();
}

}  // namespace mirrorcast::tests::contracts
