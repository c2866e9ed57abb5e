#include <gtest/gtest.h>
#include "splicerelay/relay/negotiator.h"
#include "test_support.h"

namespace splicerelay::relay {
namespace {

using io::EndpointKind;
using splicerelay::testing::MakePipeHarness;
using splicerelay::testing::MakeTcpHarness;
using splicerelay::testing::MakeUnixHarness;
using splicerelay::testing::ScriptedEndpoint;

TEST(NegotiatorTest, DefaultMatrixCoversKernelPipeLikePairs) {
  Negotiator negotiator(PlatformCapabilities{true});
  for (auto src : {EndpointKind::kPipe, EndpointKind::kTcpSocket, EndpointKind::kUnixSocket}) {
    for (auto dst : {EndpointKind::kPipe, EndpointKind::kTcpSocket, EndpointKind::kUnixSocket}) {
      EXPECT_TRUE(negotiator.IsPairSupported(src, dst)) << io::ToString(src) << "->" << io::ToString(dst);
    }
    EXPECT_FALSE(negotiator.IsPairSupported(src, EndpointKind::kGeneric));
    EXPECT_FALSE(negotiator.IsPairSupported(EndpointKind::kGeneric, src));
  }
}

TEST(NegotiatorTest, RealEndpoints) {
  auto tcp = MakeTcpHarness();
  auto unix_socket = MakeUnixHarness();
  auto pipe = MakePipeHarness();
  auto generic = MakeUnixHarness(true);

  Negotiator negotiator(PlatformCapabilities{true});
  EXPECT_TRUE(negotiator.CanZeroCopy(*tcp.endpoint, *unix_socket.endpoint));
  EXPECT_TRUE(negotiator.CanZeroCopy(*pipe.endpoint, *tcp.endpoint));
  EXPECT_FALSE(negotiator.CanZeroCopy(*generic.endpoint, *tcp.endpoint));
  EXPECT_FALSE(negotiator.CanZeroCopy(*tcp.endpoint, *generic.endpoint));

  ScriptedEndpoint scripted;
  EXPECT_FALSE(negotiator.CanZeroCopy(scripted, *tcp.endpoint));
}

TEST(NegotiatorTest, PlatformWithoutSplice) {
  auto a = MakeUnixHarness();
  auto b = MakeUnixHarness();
  Negotiator negotiator(PlatformCapabilities{false});
  EXPECT_FALSE(negotiator.CanZeroCopy(*a.endpoint, *b.endpoint));
  EXPECT_FALSE(negotiator.CanZeroCopy(*b.endpoint, *a.endpoint));
}

TEST(NegotiatorTest, CapabilityIsDirectional) {
  auto tcp = MakeTcpHarness();
  auto unix_socket = MakeUnixHarness();

  Negotiator negotiator(PlatformCapabilities{true});
  negotiator.DisablePair(EndpointKind::kTcpSocket, EndpointKind::kUnixSocket);

  EXPECT_FALSE(negotiator.CanZeroCopy(*tcp.endpoint, *unix_socket.endpoint));
  EXPECT_TRUE(negotiator.CanZeroCopy(*unix_socket.endpoint, *tcp.endpoint));

  negotiator.EnablePair(EndpointKind::kTcpSocket, EndpointKind::kUnixSocket);
  EXPECT_TRUE(negotiator.CanZeroCopy(*tcp.endpoint, *unix_socket.endpoint));
}

TEST(NegotiatorTest, EnablePairNeverAdmitsGeneric) {
  Negotiator negotiator(PlatformCapabilities{true});
  negotiator.EnablePair(EndpointKind::kGeneric, EndpointKind::kPipe);
  EXPECT_FALSE(negotiator.IsPairSupported(EndpointKind::kGeneric, EndpointKind::kPipe));
}

TEST(NegotiatorTest, ClosedPipeWriteSideIsNotEligible) {
  auto source = MakePipeHarness();
  auto destination = MakePipeHarness();
  Negotiator negotiator(PlatformCapabilities{true});
  EXPECT_TRUE(negotiator.CanZeroCopy(*source.endpoint, *destination.endpoint));

  ASSERT_TRUE(destination.endpoint->CloseWrite().ok());
  EXPECT_FALSE(negotiator.CanZeroCopy(*source.endpoint, *destination.endpoint));
}

TEST(NegotiatorTest, FromConfig) {
  common::RelayConfig config;
  config.splice_available = true;
  config.disabled_pairs = {"unix->tcp", " pipe -> pipe "};

  auto negotiator = Negotiator::FromConfig(config);
  ASSERT_TRUE(negotiator.ok());
  EXPECT_TRUE(negotiator->capabilities().splice_available);
  EXPECT_FALSE(negotiator->IsPairSupported(EndpointKind::kUnixSocket, EndpointKind::kTcpSocket));
  EXPECT_TRUE(negotiator->IsPairSupported(EndpointKind::kTcpSocket, EndpointKind::kUnixSocket));
  EXPECT_FALSE(negotiator->IsPairSupported(EndpointKind::kPipe, EndpointKind::kPipe));
}

TEST(NegotiatorTest, FromConfigRejectsMalformedPairs) {
  common::RelayConfig config;
  config.disabled_pairs = {"tcp=>unix"};
  auto negotiator = Negotiator::FromConfig(config);
  EXPECT_FALSE(negotiator.ok());
  EXPECT_EQ(common::GetRelayErrorCode(negotiator.status()), common::RelayErrorCode::kInvalidArgument);

  config.disabled_pairs = {"tcp->carrier-pigeon"};
  EXPECT_FALSE(Negotiator::FromConfig(config).ok());
}

}
}
