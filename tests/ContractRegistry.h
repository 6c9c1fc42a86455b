#ifndef DECKSYNC_TESTS_CONTRACT_REGISTRY_H_
#define DECKSYNC_TESTS_CONTRACT_REGISTRY_H_

#include <cstddef>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace decksync::tests
{

// Which tests exercised which rule, per domain. Filled in as contract tests
// start; read once by the coverage environment when the binary finishes.
class ContractRegistry
{
public:
  static ContractRegistry& Instance();

  void Record(const std::string& domain, const std::string& rule_id,
              const std::string& test_name);

  // Rules from `expected` that no test in `domain` has exercised.
  std::vector<std::string> Uncovered(const std::string& domain,
                                     const std::vector<std::string>& expected) const;

  std::size_t CoveredRuleCount(const std::string& domain) const;

private:
  ContractRegistry() = default;
  ContractRegistry(const ContractRegistry&) = delete;
  ContractRegistry& operator=(const ContractRegistry&) = delete;

  mutable std::mutex mutex_;
  // domain -> rule id -> test names
  std::map<std::string, std::map<std::string, std::set<std::string>>> coverage_;
};

// "DAU_007_RejectionsCarryErrorCodes" -> "DAU-007". Empty when the name does
// not start with a rule id.
std::string RuleIdFromTestName(const std::string& test_name);

} // namespace decksync::tests

#endif // DECKSYNC_TESTS_CONTRACT_REGISTRY_H_
