#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/error/warehouse_operation_errors.hpp"
#include "internal/model/ids.hpp"

namespace {

using catalog::error::CatalogBackendError;
using catalog::error::DeleteWarehouseError;
using catalog::error::RenameWarehouseError;
using catalog::error::WarehouseIdNotFound;
using catalog::error::WarehouseNotEmpty;
using catalog::error::WarehouseProtected;
using catalog::model::WarehouseId;

void TestAppendKeepsInsertionOrder() {
  WarehouseNotEmpty err;
  err.AppendDetail("a");
  err.AppendDetails({"b", "c"});
  err.AppendDetails({"d", "e", "f"});

  const std::vector<std::string> expected = {"a", "b", "c", "d", "e", "f"};
  assert(err.Stack() == expected);
}

void TestConsumingAppendChains() {
  auto err = WarehouseProtected().AppendDetail("deleting warehouse").AppendDetails({"handling request", "http"});

  assert(err.Stack().size() == 3);
  assert(err.Stack()[0] == "deleting warehouse");
  assert(err.Stack()[2] == "http");
  assert(std::string(err.what()).find("protected") != std::string::npos);
}

void TestEmptyAppendIsNoop() {
  WarehouseNotEmpty err;
  err.AppendDetails({});
  assert(err.Stack().empty());
}

void TestOperationErrorAppendsContextOnce() {
  const auto           id = WarehouseId::Generate();
  RenameWarehouseError op(WarehouseIdNotFound(id).AppendDetail("store"));

  assert(op.Is<WarehouseIdNotFound>());
  assert(op.As<WarehouseIdNotFound>().Id() == id);
  assert(op.Stack().size() == 2);
  assert(op.Stack()[0] == "store");
  assert(op.Stack()[1] == "Error renaming warehouse in catalog");
  assert(std::string(op.what()) == "A warehouse with id '" + id.ToString() + "' does not exist");
}

void TestOperationErrorAppendDetailReachesAlternative() {
  DeleteWarehouseError op = WarehouseNotEmpty();
  op.AppendDetail("handling DELETE");

  assert(op.Stack().size() == 2);
  assert(op.As<WarehouseNotEmpty>().Stack().back() == "handling DELETE");
}

void TestCaptureRethrowsMemberErrorsAsOperationError() {
  bool caught = false;
  try {
    DeleteWarehouseError::Capture([] { throw WarehouseProtected(); });
  } catch (const DeleteWarehouseError& op) {
    caught = true;
    assert(op.Is<WarehouseProtected>());
    assert(op.Stack() == std::vector<std::string>{"Error deleting warehouse in catalog"});
  }
  assert(caught);
}

void TestCaptureReturnsValue() {
  const int value = RenameWarehouseError::Capture([] { return 42; });
  assert(value == 42);
}

void TestCaptureLeavesForeignExceptionsUntouched() {
  bool caught = false;
  try {
    RenameWarehouseError::Capture([] { throw WarehouseProtected(); });
  } catch (const RenameWarehouseError&) {
    assert(false && "WarehouseProtected is not a rename error");
  } catch (const WarehouseProtected& err) {
    caught = true;
    assert(err.Stack().empty());
  }
  assert(caught);
}

void TestCaptureBackendError() {
  bool caught = false;
  try {
    RenameWarehouseError::Capture([] { throw CatalogBackendError::Unexpected("disk on fire"); });
  } catch (const RenameWarehouseError& op) {
    caught = true;
    assert(op.Is<CatalogBackendError>());
    assert(op.As<CatalogBackendError>().Source().Message() == "disk on fire");
  }
  assert(caught);
}

} // namespace

int main() {
  TestAppendKeepsInsertionOrder();
  TestConsumingAppendChains();
  TestEmptyAppendIsNoop();
  TestOperationErrorAppendsContextOnce();
  TestOperationErrorAppendDetailReachesAlternative();
  TestCaptureRethrowsMemberErrorsAsOperationError();
  TestCaptureReturnsValue();
  TestCaptureLeavesForeignExceptionsUntouched();
  TestCaptureBackendError();

  std::cout << "catalog_manager_unit_error_stack: pass\n";
  return 0;
}
