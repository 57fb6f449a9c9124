#include "runtime/local_bank.h"
#include "common/base58.h"
#include "common/logging.h"
#include <limits>

namespace palisade {
namespace runtime {

namespace {

// Clears the active dispatcher when invoke() leaves, on every path
class ActiveGuard {
public:
  ActiveGuard(const Dispatcher *&slot, const Dispatcher &dispatcher)
      : slot_(slot) {
    slot_ = &dispatcher;
  }
  ~ActiveGuard() { slot_ = nullptr; }

private:
  const Dispatcher *&slot_;
};

bool same_contents(const AccountInfo &a, const AccountInfo &b) {
  return a.lamports == b.lamports && a.owner == b.owner && a.data == b.data;
}

} // namespace

LocalBank::LocalBank(const RuntimeConfig &config)
    : rent_(RentCalculator::from_config(config)),
      system_program_id_(config.system_program_id) {}

LocalBank::LocalBank(RentCalculator rent, PublicKey system_program_id)
    : rent_(std::move(rent)), system_program_id_(std::move(system_program_id)) {}

void LocalBank::set_account(const PublicKey &key, Lamports lamports,
                            const PublicKey &owner, std::vector<uint8_t> data,
                            bool executable) {
  AccountInfo info;
  info.pubkey = key;
  info.owner = owner;
  info.lamports = lamports;
  info.data = std::move(data);
  info.executable = executable;
  accounts_[key] = std::move(info);
}

std::optional<AccountInfo> LocalBank::get_account(const PublicKey &key) const {
  auto it = accounts_.find(key);
  if (it == accounts_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool LocalBank::has_account(const PublicKey &key) const {
  return accounts_.find(key) != accounts_.end();
}

DispatchOutcome LocalBank::invoke(Dispatcher &dispatcher,
                                  const std::vector<AccountMeta> &metas,
                                  const std::vector<uint8_t> &raw) {
  return invoke(dispatcher, dispatcher.ids().program_id, metas, raw);
}

DispatchOutcome LocalBank::invoke(Dispatcher &dispatcher,
                                  const PublicKey &program_id,
                                  const std::vector<AccountMeta> &metas,
                                  const std::vector<uint8_t> &raw) {
  // Working copies, one per distinct key
  std::vector<AccountInfo> working;
  std::vector<AccountInfo> originals;
  std::unordered_map<PublicKey, size_t> slot_of;
  std::vector<size_t> slots;
  working.reserve(metas.size());
  slots.reserve(metas.size());

  for (const auto &meta : metas) {
    auto found = slot_of.find(meta.pubkey);
    size_t slot;
    if (found != slot_of.end()) {
      slot = found->second;
    } else {
      slot = working.size();
      slot_of[meta.pubkey] = slot;

      AccountInfo copy;
      auto stored = accounts_.find(meta.pubkey);
      if (stored != accounts_.end()) {
        copy = stored->second;
      } else {
        copy.pubkey = meta.pubkey;
        copy.owner = system_program_id_;
      }
      copy.is_signer = false;
      copy.is_writable = false;
      working.push_back(std::move(copy));
    }
    working[slot].is_signer = working[slot].is_signer || meta.is_signer;
    working[slot].is_writable = working[slot].is_writable || meta.is_writable;
    slots.push_back(slot);
  }
  originals = working;

  // working is not resized from here on, so the pointers stay valid
  std::vector<AccountHandle> handles;
  handles.reserve(slots.size());
  for (size_t slot : slots) {
    handles.emplace_back(&working[slot]);
  }

  DispatchOutcome outcome;
  {
    ActiveGuard guard(active_, dispatcher);
    outcome = dispatcher.dispatch(program_id, handles, raw, *this);
  }

  if (!outcome.is_success()) {
    LOG_DEBUG("bank", "Discarded changes to ", working.size(),
              " accounts after failed instruction");
    return outcome;
  }

  for (size_t i = 0; i < working.size(); ++i) {
    if (!working[i].is_writable && !same_contents(working[i], originals[i])) {
      std::unordered_map<std::string, std::string> context{
          {"account", base58::encode(working[i].pubkey)}};
      LOG_HOST_ERROR("Read-only account modified", "NotWritable", context);
      outcome.status = DispatchStage::FAILED;
      outcome.failure = ProgramFailure(ProgramError::NOT_WRITABLE);
      return outcome;
    }
  }

  for (auto &account : working) {
    if (!account.is_writable) {
      continue;
    }
    account.is_signer = false;
    account.is_writable = false;
    if (account.lamports == 0) {
      accounts_.erase(account.pubkey);
    } else {
      accounts_[account.pubkey] = std::move(account);
    }
  }

  LOG_DEBUG("bank", "Committed instruction over ", working.size(), " accounts");
  return outcome;
}

ProgramResult LocalBank::transfer_lamports(const AccountHandle &from,
                                           const AccountHandle &to,
                                           Lamports amount) {
  if (!from.is_writable() || !to.is_writable()) {
    return fail(ProgramError::NOT_WRITABLE);
  }

  bool program_owned =
      active_ && from.is_owned_by(active_->ids().program_id);
  if (!from.is_signer() && !program_owned) {
    return fail(ProgramError::NOT_SIGNER);
  }

  if (from.lamports() < amount) {
    return fail(ProgramError::INSUFFICIENT_FUNDS);
  }
  if (from.aliases(to)) {
    return success();
  }
  if (to.lamports() > std::numeric_limits<Lamports>::max() - amount) {
    return fail(ProgramError::ARITHMETIC_OVERFLOW);
  }

  from.set_lamports(from.lamports() - amount);
  to.set_lamports(to.lamports() + amount);
  return success();
}

bool LocalBank::authorized_by_seeds(const AccountHandle &target,
                                    const Seeds &signer_seeds) const {
  if (!active_ || signer_seeds.empty() || signer_seeds.back().size() != 1) {
    return false;
  }

  Seeds prefix(signer_seeds.begin(), signer_seeds.end() - 1);
  uint8_t bump = signer_seeds.back()[0];
  return active_->pda().verify_with_known_bump(target.key(), prefix, bump,
                                               active_->ids().program_id);
}

ProgramResult LocalBank::create_pda_account(const AccountHandle &payer,
                                            const AccountHandle &target,
                                            size_t space,
                                            const PublicKey &owner,
                                            const Seeds &signer_seeds) {
  if (!payer.is_signer()) {
    return fail(ProgramError::NOT_SIGNER);
  }
  if (!payer.is_writable() || !target.is_writable()) {
    return fail(ProgramError::NOT_WRITABLE);
  }
  if (!target.is_owned_by(system_program_id_) || target.lamports() != 0 ||
      target.data_len() != 0) {
    return fail(ProgramError::ALREADY_INITIALIZED);
  }
  if (!target.is_signer() && !authorized_by_seeds(target, signer_seeds)) {
    return fail(ProgramError::INVALID_SEEDS);
  }

  Lamports required = rent_.minimum_balance(space);
  if (payer.lamports() < required) {
    return fail(ProgramError::INSUFFICIENT_FUNDS);
  }

  payer.set_lamports(payer.lamports() - required);
  target.set_lamports(required);
  target.info()->data.assign(space, 0);
  target.assign_owner(owner);

  LOG_DEBUG("bank", "Created account ", base58::encode(target.key()), " space=",
            space, " lamports=", required);
  return success();
}

} // namespace runtime
} // namespace palisade
