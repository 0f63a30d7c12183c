#pragma once

#include <string>
#include <vector>
#include <map>

#include "rules/card.h"
#include "zones/zone.h"

class PlayerConfig
{
public:
    std::string name;
    std::string hero;
    std::string faction;
    int max_health;
    bool is_lord;
    // Opening hand, by registered card name.
    std::vector<std::string> hand;

    PlayerConfig(const std::string& name,
                 const std::string& hero,
                 const std::string& faction,
                 int max_health,
                 bool is_lord = false,
                 const std::vector<std::string>& hand = {})
        : name(name), hero(hero), faction(faction), max_health(max_health), is_lord(is_lord), hand(hand) {}
};

class Player
{
public:
    int seat;
    std::string name;
    std::string hero;
    std::string faction;
    int max_health;
    int health;
    bool alive = true;
    bool is_lord;

    Zone hand;
    Zone equipment;
    Zone judgement;

    Player(int seat, const PlayerConfig& config);

    Player(const Player&) = delete;
    Player& operator=(const Player&) = delete;

    // Returns the health after the damage is applied. Health never drops below zero.
    int takeDamage(int amount);
    int heal(int amount);
    bool isWounded() const;

    Card* equipped(CardSubType slot) const;

    int usesThisTurn(CardSubType subtype) const;
    void recordUse(CardSubType subtype);
    void resetTurnUsage();

    std::string toString() const;

private:
    std::map<CardSubType, int> uses_this_turn;
};
