// standard_abilities.h
#pragma once

void registerStandardAbilities();
