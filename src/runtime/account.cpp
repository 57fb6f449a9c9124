#include "runtime/account.h"
#include <algorithm>
#include <limits>

namespace palisade {
namespace runtime {

std::vector<AccountHandle> make_handles(std::vector<AccountInfo> &accounts) {
  std::vector<AccountHandle> handles;
  handles.reserve(accounts.size());
  for (auto &account : accounts) {
    handles.emplace_back(&account);
  }
  return handles;
}

ProgramIds ProgramIds::from_config(const RuntimeConfig &config) {
  ProgramIds ids;
  ids.program_id = config.program_id;
  ids.system_program_id = config.system_program_id;
  ids.token_program_id = config.token_program_id;
  return ids;
}

ProgramResult close_account(const AccountHandle &account,
                            const AccountHandle &receiver,
                            const PublicKey &system_program_id) {
  if (!account.is_writable()) {
    return fail(ProgramError::NOT_WRITABLE);
  }
  if (!receiver.is_writable()) {
    return fail(ProgramError::NOT_WRITABLE);
  }
  if (account.aliases(receiver)) {
    return success();
  }

  Lamports moved = account.lamports();
  if (receiver.lamports() > std::numeric_limits<Lamports>::max() - moved) {
    return fail(ProgramError::ARITHMETIC_OVERFLOW);
  }

  receiver.set_lamports(receiver.lamports() + moved);
  account.set_lamports(0);

  if (account.data_len() > 0) {
    std::fill(account.data(), account.data() + account.data_len(), 0);
    account.data()[0] = CLOSED_ACCOUNT_MARKER;
  }
  account.assign_owner(system_program_id);

  return success();
}

} // namespace runtime
} // namespace palisade
