/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __HAMSKY_CONFIG_HPP
#define __HAMSKY_CONFIG_HPP

#include <hamsky/types.hpp>

#include <chrono>
#include <string>

namespace hamsky {

class Config {
public:
    Config() = default;
    ~Config() = default;

    double getLatitude();
    void setLatitude(const double l);

    double getLongitude();
    void setLongitude(const double l);

    double getAltitude();
    void setAltitude(const double a);

    GeodeticPosition getObserver();

    double getMinimumElevation();
    void setMinimumElevation(const double degrees);

    int getHours();
    void setHours(const int hours);

    int getWorkerThreads();
    void setWorkerThreads(const int threads);

    std::chrono::hours getStalenessHorizon();
    void setStalenessHorizon(const int hours);

    std::string getElementFile();
    void setElementFile(const std::string &path);

    bool getVerbose();
    void setVerbose(bool);

    bool getJSON();
    void setJSON(bool);

    time_point getTime();
    void setTime(const time_point tp);

private:
    double latitude = 0.0;
    double longitude = 0.0;
    double altitude = 0.0;
    double minimumElevation = 0.0;
    int hours = 24;
    int workerThreads = 2;
    int stalenessHorizon = 24;
    std::string elementFile;
    bool verbose = false;
    bool json = false;
    time_point time = std::chrono::system_clock::now();
};

}

#endif
