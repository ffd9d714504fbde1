// Health and damage rules shared by projectiles and the movement sweep.
#pragma once

namespace Engine::Gameplay {

struct UnitHealth {
    float maxHealth = 0.0f;
    float currentHealth = 0.0f;

    // Zero counts as dead: a hit that lands exactly on 0 destroys the unit.
    bool isDead() const { return currentHealth <= 0.0f; }
    bool alive() const { return !isDead(); }
};

inline UnitHealth makeHealth(float maxHealth) { return UnitHealth{maxHealth, maxHealth}; }

struct DamageEvent {
    float baseDamage = 0.0f;
};

// Subtracts the full amount with no floor, so overkill stays visible in
// snapshots. Hits on an already dead unit are ignored.
inline void applyDamage(UnitHealth& target, const DamageEvent& dmg) {
    if (target.isDead()) {
        return;
    }
    if (dmg.baseDamage <= 0.0f) {
        return;
    }
    target.currentHealth -= dmg.baseDamage;
}

}  // namespace Engine::Gameplay
