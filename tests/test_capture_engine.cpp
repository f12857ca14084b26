#include <doctest/doctest.h>

#include <stdexcept>

#include "capture_engine.hpp"

TEST_CASE("The server port is read from the BPF filter")
{
    CHECK(CaptureEngine::extractPortFromFilter("tcp port 80") == 80);
    CHECK(CaptureEngine::extractPortFromFilter("host 10.0.0.2 and port   8080") == 8080);
    CHECK(CaptureEngine::extractPortFromFilter("tcp") == 0);
    CHECK(CaptureEngine::extractPortFromFilter("tcp port http") == 0);
    CHECK(CaptureEngine::extractPortFromFilter("tcp port 70000") == 0);
    CHECK(CaptureEngine::extractPortFromFilter("tcp port 0") == 0);
}

TEST_CASE("Opening a missing capture file fails loudly")
{
    CHECK_THROWS_AS(CaptureEngine("/nonexistent/trace.pcap", CaptureEngine::Source::File), std::runtime_error);
}
