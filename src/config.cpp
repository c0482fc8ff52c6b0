/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <hamsky/config.hpp>

#include <algorithm>

namespace hamsky {

double Config::getLatitude() {
    return latitude;
}

void Config::setLatitude(const double l) {
    latitude = l;
}

double Config::getLongitude() {
    return longitude;
}

void Config::setLongitude(const double l) {
    longitude = l;
}

double Config::getAltitude() {
    return altitude;
}

void Config::setAltitude(const double a) {
    altitude = a;
}

GeodeticPosition Config::getObserver() {
    return {latitude, longitude, altitude};
}

double Config::getMinimumElevation() {
    return minimumElevation;
}

void Config::setMinimumElevation(const double degrees) {
    if (degrees >= 0 && degrees <= 90) {
        minimumElevation = degrees;
    } else if (degrees > 90) {
        minimumElevation = 90;
    } else {
        minimumElevation = 0;
    }
}

int Config::getHours() {
    return hours;
}

void Config::setHours(const int h) {
    if (h > 0 && h <= 240) {
        hours = h;
    } else if (h > 240) {
        hours = 240;
    } else {
        hours = 1;
    }
}

int Config::getWorkerThreads() {
    return workerThreads;
}

void Config::setWorkerThreads(const int threads) {
    workerThreads = std::clamp(threads, 1, 64);
}

std::chrono::hours Config::getStalenessHorizon() {
    return std::chrono::hours(stalenessHorizon);
}

void Config::setStalenessHorizon(const int h) {
    stalenessHorizon = std::clamp(h, 1, 720);
}

std::string Config::getElementFile() {
    return elementFile;
}

void Config::setElementFile(const std::string &path) {
    elementFile = path;
}

bool Config::getVerbose() {
    return verbose;
}

void Config::setVerbose(bool v) {
    verbose = v;
}

bool Config::getJSON() {
    return json;
}

void Config::setJSON(bool j) {
    json = j;
}

time_point Config::getTime() {
    return time;
}

void Config::setTime(const time_point tp) {
    time = tp;
}

}
