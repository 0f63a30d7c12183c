// standard_abilities.cpp
#include "standard_abilities.h"

#include "abilities/ability_registry.h"
#include "equipment_abilities.h"
#include "hero_abilities.h"

#include <memory>

void registerStandardAbilities() {
    AbilityRegistry& registry = AbilityRegistry::instance();

    registry.registerAbility("yingzi", [] { return std::make_unique<YingziAbility>(); });
    registry.registerAbility("roar", [] { return std::make_unique<RoarAbility>(); });
    registry.registerAbility("wushuang", [] { return std::make_unique<WushuangAbility>(); });
    registry.registerAbility("horsemanship", [] { return std::make_unique<HorsemanshipAbility>(); });
    registry.registerAbility("longdan", [] { return std::make_unique<LongdanAbility>(); });
    registry.registerAbility("jianxiong", [] { return std::make_unique<JianxiongAbility>(); });
    registry.registerAbility("ganglie", [] { return std::make_unique<GanglieAbility>(); });
    registry.registerAbility("hujia", [] { return std::make_unique<HujiaAbility>(); });

    registry.registerAbility("zhuge_crossbow", [] { return std::make_unique<ZhugeCrossbowAbility>(); });
    registry.registerAbility("qinglong_blade", [] { return std::make_unique<WeaponRangeAbility>("qinglong_blade", 3); });
    registry.registerAbility("kirin_bow", [] { return std::make_unique<WeaponRangeAbility>("kirin_bow", 5); });
    registry.registerAbility("defensive_horse", [] { return std::make_unique<DefensiveHorseAbility>(); });
    registry.registerAbility("offensive_horse", [] { return std::make_unique<OffensiveHorseAbility>(); });
    registry.registerAbility("renwang_shield", [] { return std::make_unique<RenwangShieldAbility>(); });
    registry.registerAbility("bagua_array", [] { return std::make_unique<BaguaArrayAbility>(); });

    registry.registerHero("cao_cao", {"jianxiong", "hujia"});
    registry.registerHero("xiahou_dun", {"ganglie"});
    registry.registerHero("zhou_yu", {"yingzi"});
    registry.registerHero("zhang_fei", {"roar"});
    registry.registerHero("lu_bu", {"wushuang"});
    registry.registerHero("ma_chao", {"horsemanship"});
    registry.registerHero("zhao_yun", {"longdan"});
}
