// Example: three replicas of one register edited without coordination
#include "lww_register.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace lww_crdt;

int main() {
  // Each device starts its own register, so each has its own tie-breaking id
  LWWRegister<std::string> laptop("Untitled");
  LWWRegister<std::string> phone("Untitled");
  LWWRegister<std::string> tablet("Untitled");

  std::cout << "Laptop id: " << UniqueIdTraits::to_uuid_string(laptop.timestamp().id()) << std::endl;
  std::cout << "Phone id:  " << UniqueIdTraits::to_uuid_string(phone.timestamp().id()) << std::endl;
  std::cout << "Tablet id: " << UniqueIdTraits::to_uuid_string(tablet.timestamp().id()) << std::endl;

  // Offline edits
  laptop.set_value("Quarterly report");
  phone.set_value("Q3 report");
  phone.set_value("Q3 report (draft)");
  tablet.set_value("Report");

  std::cout << "\nBefore sync:" << std::endl;
  std::cout << "  " << laptop << std::endl;
  std::cout << "  " << phone << std::endl;
  std::cout << "  " << tablet << std::endl;

  // Sync over the wire in both directions
  auto from_phone = LWWRegister<std::string>::deserialize(phone.serialize());
  if (!from_phone) {
    std::cerr << "Failed to decode replica from phone" << std::endl;
    return 1;
  }
  laptop.merge(*from_phone);
  tablet.merge(laptop);
  phone.merge(tablet);

  std::cout << "\nAfter sync:" << std::endl;
  std::cout << "  " << laptop << std::endl;
  std::cout << "  " << phone << std::endl;
  std::cout << "  " << tablet << std::endl;

  std::vector<LWWRegister<std::string>> devices = {laptop, phone, tablet};
  auto converged = merge_all(devices);
  std::cout << "\nConverged title: " << converged->value() << std::endl;

  return (laptop == phone && phone == tablet) ? 0 : 1;
}
