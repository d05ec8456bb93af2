#include <cassert>
#include <iostream>

#include "internal/model/state_machine.hpp"

namespace {

using namespace waveq::engine::v1;
using waveq::model::CanTransition;
using waveq::model::IsTerminal;

void TestLegalEdges() {
  assert(CanTransition(REQUEST_STATUS_QUEUED, REQUEST_STATUS_PROCESSING));
  assert(CanTransition(REQUEST_STATUS_QUEUED, REQUEST_STATUS_CANCELLED));
  assert(CanTransition(REQUEST_STATUS_PROCESSING, REQUEST_STATUS_COMPLETED));
  assert(CanTransition(REQUEST_STATUS_PROCESSING, REQUEST_STATUS_ERROR));
  assert(CanTransition(REQUEST_STATUS_PROCESSING, REQUEST_STATUS_CANCELLED));
}

void TestSkippingProcessingIsIllegal() {
  assert(!CanTransition(REQUEST_STATUS_QUEUED, REQUEST_STATUS_COMPLETED));
  assert(!CanTransition(REQUEST_STATUS_QUEUED, REQUEST_STATUS_ERROR));
  assert(!CanTransition(REQUEST_STATUS_PROCESSING, REQUEST_STATUS_QUEUED));
  assert(!CanTransition(REQUEST_STATUS_QUEUED, REQUEST_STATUS_QUEUED));
}

void TestNothingLeavesTerminalStates() {
  const RequestStatus all[] = {REQUEST_STATUS_QUEUED, REQUEST_STATUS_PROCESSING, REQUEST_STATUS_COMPLETED, REQUEST_STATUS_ERROR,
                               REQUEST_STATUS_CANCELLED};
  for (auto from : {REQUEST_STATUS_COMPLETED, REQUEST_STATUS_ERROR, REQUEST_STATUS_CANCELLED}) {
    assert(IsTerminal(from));
    for (auto to : all) {
      assert(!CanTransition(from, to));
    }
  }
  assert(!IsTerminal(REQUEST_STATUS_QUEUED));
  assert(!IsTerminal(REQUEST_STATUS_PROCESSING));
}

void TestStatusNamesRoundTrip() {
  for (auto status : {REQUEST_STATUS_QUEUED, REQUEST_STATUS_PROCESSING, REQUEST_STATUS_COMPLETED, REQUEST_STATUS_ERROR, REQUEST_STATUS_CANCELLED}) {
    assert(waveq::model::ParseStatus(waveq::model::StatusName(status)) == status);
  }
  assert(waveq::model::ParseStatus("done") == REQUEST_STATUS_UNSPECIFIED);
}

} // namespace

int main() {
  TestLegalEdges();
  TestSkippingProcessingIsIllegal();
  TestNothingLeavesTerminalStates();
  TestStatusNamesRoundTrip();

  std::cout << "waveq_unit_state_machine: pass\n";
  return 0;
}
