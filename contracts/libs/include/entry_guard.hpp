#pragma once

#include <plstr.const.hpp>

namespace plstr {

/**
 * Holds the per-contract entry flag for the lifetime of one mutating entry point.
 * A nested entry into any guarded entry point of the same instance is rejected;
 * the flag is released when the guard leaves scope.
 * Every action, inline action and notification runs on a fresh contract object, so the
 * flag only spans the entry point's own call tree and never blocks a separate action.
 */
class entry_guard {
   public:
      explicit entry_guard( bool& entered ): _entered(entered) {
         CHECKC( !_entered, err::REENTRANT_CALL, "reentrant call" )
         _entered = true;
      }

      ~entry_guard() { _entered = false; }

      entry_guard( const entry_guard& ) = delete;
      entry_guard& operator=( const entry_guard& ) = delete;

   private:
      bool& _entered;
};

} //namespace plstr
