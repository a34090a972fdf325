#pragma once

#include "core/Interpreter.hpp"
#include "core/State.hpp"
#include "core/Subrelation.hpp"
#include "core/Turn.hpp"

namespace minipoker {

/*
 * A one-card bluffing game.
 *
 * The chance role deals a red or a black card to the bluffer. Holding red, the bluffer may resign
 * (-10) or hold; holding black it must hold. The caller, who has not seen the card, then resigns
 * (bluffer +4) or calls: a call wins 20 on red and loses 16 on black. Goals are zero-sum.
 *
 * The bluffer and the chance role see the whole state. The caller sees everything but the colour
 * of the card until it calls.
 */
class Interpreter : public core::Interpreter {
 public:
  static const core::Role& bluffer();
  static const core::Role& caller();

  static core::Subrelation red();
  static core::Subrelation black();

  static core::Move deal(const core::Subrelation& colour);
  static core::Move hold();
  static core::Move call();
  static core::Move resign();

  static core::Subrelation control(const core::Role& role);
  static core::Subrelation dealt();
  static core::Subrelation dealt(const core::Subrelation& colour);
  static core::Subrelation held();
  static core::Subrelation called();
  static core::Subrelation resigned(const core::Role& role);

  roles_t get_roles() const override;
  core::State get_init_state() const override;
  sees_t get_sees(const core::State& state) const override;
  legal_moves_t get_legal_moves(const core::State& state) const override;
  goals_t get_goals(const core::State& state) const override;
  bool is_terminal(const core::State& state) const override;

 protected:
  core::State get_next_state_impl(const core::State& state,
                                  const core::Turn& turn) const override;
};

}  // namespace minipoker
