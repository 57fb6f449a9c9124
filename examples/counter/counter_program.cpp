#include "counter_program.h"
#include "common/logging.h"
#include <algorithm>
#include <limits>

namespace palisade {
namespace counter {

const char *const COUNTER_PROGRAM_ADDRESS =
    "Cntrt7BXEtNAnSo9ecGs9n9KkHGDF73Shr3xqFvsvQTJ";

const char COUNTER_SEED[] = "counter";

static_assert(sizeof(Counter) == Counter::LEN, "Counter layout drifted");

bool Counter::is_owned_by(const PublicKey &key) const {
  return key.size() == owner.size() &&
         std::equal(owner.begin(), owner.end(), key.begin());
}

void Counter::set_owner(const PublicKey &key) {
  owner.fill(0);
  std::copy_n(key.begin(), std::min(key.size(), owner.size()), owner.begin());
}

LayoutDescriptor Counter::descriptor() {
  return LayoutDescriptor{"Counter",
                          LEN,
                          {PALISADE_FIELD(Counter, owner),
                           PALISADE_FIELD(Counter, count),
                           PALISADE_FIELD(Counter, bump)}};
}

Seeds counter_seeds(const PublicKey &owner) {
  return Seeds{seed_bytes(COUNTER_SEED), owner};
}

std::vector<uint8_t> instruction_data(CounterInstruction instruction) {
  return {static_cast<uint8_t>(instruction)};
}

namespace {

// Owner and counter bindings shared by every counter instruction
ProgramResult bind_owner_and_counter(InstructionContext &ctx,
                                     AccountHandle &owner,
                                     AccountHandle &counter) {
  auto owner_binding = ctx.account("owner");
  if (owner_binding.is_err()) {
    return fail(owner_binding.error());
  }
  auto counter_binding = ctx.account("counter");
  if (counter_binding.is_err()) {
    return fail(counter_binding.error());
  }
  owner = owner_binding.value();
  counter = counter_binding.value();
  return success();
}

ProgramResult initialize_counter(InstructionContext &ctx) {
  AccountHandle owner;
  AccountHandle counter;
  auto bound = bind_owner_and_counter(ctx, owner, counter);
  if (bound.is_err()) {
    return bound;
  }

  if (counter.data_len() > 0) {
    return fail_custom(code(CounterError::COUNTER_ALREADY_INITIALIZED));
  }

  Seeds seeds = counter_seeds(owner.key());
  auto derived = ctx.pda().derive(seeds, ctx.program_id());
  if (derived.is_err()) {
    return fail(derived.error());
  }
  if (counter.key() != derived.value().address) {
    return fail_custom(code(CounterError::COUNTER_KEY_INCORRECT));
  }
  uint8_t bump = derived.value().bump;

  auto created = ctx.host().create_pda_account(
      owner, counter, Counter::LEN, ctx.program_id(), with_bump(seeds, bump));
  if (created.is_err()) {
    return created;
  }

  return with_state<Counter>(counter, [&](Counter &state) {
    state.set_owner(owner.key());
    state.set_count(0);
    state.bump = bump;
  });
}

// Shared checks for increment and decrement: owner match, then PDA with the
// stored bump
ProgramResult load_owned_counter(InstructionContext &ctx, Counter *&out) {
  AccountHandle owner;
  AccountHandle counter;
  auto bound = bind_owner_and_counter(ctx, owner, counter);
  if (bound.is_err()) {
    return bound;
  }

  auto state = load_mut<Counter>(counter);
  if (state.is_err()) {
    return fail_custom(code(CounterError::COUNTER_NOT_INITIALIZED));
  }
  Counter *counter_state = state.value();

  if (!counter_state->is_owned_by(owner.key())) {
    return fail_custom(code(CounterError::UNAUTHORIZED));
  }

  auto pda_ok = ctx.assert_pda(counter, counter_seeds(owner.key()),
                               counter_state->bump,
                               code(CounterError::COUNTER_KEY_INCORRECT));
  if (pda_ok.is_err()) {
    return pda_ok;
  }

  out = counter_state;
  return success();
}

ProgramResult increment(InstructionContext &ctx) {
  Counter *state = nullptr;
  auto loaded = load_owned_counter(ctx, state);
  if (loaded.is_err()) {
    return loaded;
  }

  uint64_t current = state->get_count();
  if (current < std::numeric_limits<uint64_t>::max()) {
    state->set_count(current + 1);
  }
  LOG_DEBUG("counter", "Incremented to ", state->get_count());
  return success();
}

ProgramResult decrement(InstructionContext &ctx) {
  Counter *state = nullptr;
  auto loaded = load_owned_counter(ctx, state);
  if (loaded.is_err()) {
    return loaded;
  }

  uint64_t current = state->get_count();
  if (current == 0) {
    return fail_custom(code(CounterError::COUNTER_UNDERFLOW));
  }
  state->set_count(current - 1);
  LOG_DEBUG("counter", "Decremented to ", state->get_count());
  return success();
}

std::vector<AccountConstraintSpec> owner_and_counter(const std::string &verb) {
  return {
      {"owner", AccountKind::SIGNER, false, "Owner of the counter"},
      {"counter", AccountKind::PROGRAM_OWNED, true, "Counter PDA to " + verb},
  };
}

} // namespace

bool register_counter_program(SchemaRegistry &registry) {
  bool ok = true;

  InstructionSchema init;
  init.discriminant = static_cast<uint8_t>(CounterInstruction::INITIALIZE_COUNTER);
  init.name = "InitializeCounter";
  init.accounts = {
      {"owner", AccountKind::SIGNER, true, "Owner of the counter"},
      {"counter", AccountKind::UNINITIALIZED, false,
       "Counter PDA to be initialized"},
      {"system_program", AccountKind::ANY, false, "System program"},
  };
  ok = registry.register_instruction(std::move(init),
                                     make_handler(initialize_counter))
           .is_ok() && ok;

  InstructionSchema inc;
  inc.discriminant = static_cast<uint8_t>(CounterInstruction::INCREMENT);
  inc.name = "Increment";
  inc.accounts = owner_and_counter("increment");
  ok = registry.register_instruction(std::move(inc), make_handler(increment))
           .is_ok() && ok;

  InstructionSchema dec;
  dec.discriminant = static_cast<uint8_t>(CounterInstruction::DECREMENT);
  dec.name = "Decrement";
  dec.accounts = owner_and_counter("decrement");
  ok = registry.register_instruction(std::move(dec), make_handler(decrement))
           .is_ok() && ok;

  ok = registry.register_layout<Counter>().is_ok() && ok;

  ok = registry.register_error(code(CounterError::UNAUTHORIZED), "Unauthorized",
                               "Signer does not own the counter")
           .is_ok() && ok;
  ok = registry.register_error(code(CounterError::COUNTER_KEY_INCORRECT),
                               "CounterKeyIncorrect",
                               "Counter address does not match its seeds")
           .is_ok() && ok;
  ok = registry.register_error(code(CounterError::COUNTER_ALREADY_INITIALIZED),
                               "CounterAlreadyInitialized",
                               "Counter already holds state")
           .is_ok() && ok;
  ok = registry.register_error(code(CounterError::COUNTER_NOT_INITIALIZED),
                               "CounterNotInitialized",
                               "Counter holds no state")
           .is_ok() && ok;
  ok = registry.register_error(code(CounterError::COUNTER_UNDERFLOW),
                               "CounterUnderflow",
                               "Counter is already zero")
           .is_ok() && ok;

  registry.seal();
  return ok;
}

} // namespace counter
} // namespace palisade
