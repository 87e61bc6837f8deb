#pragma once

// Read-only switches of the center reduction
struct Config {
    bool searchCompleteSlices = true;
    bool searchCompleteSlicesOnlyTargetZero = true;
    bool searchBlocks = true;
    bool oddCubeSwitchCenters = false;
    bool preserveCage = false;
    bool sanityCheckIsBoy = false;
    bool validateTrackers = false;

    // Cage mode turns off every shortcut that cannot be undone exactly
    bool useCompleteSlices() const { return searchCompleteSlices && !preserveCage; }
    bool useOddCubeSwitchCenters() const { return oddCubeSwitchCenters && !preserveCage; }
};
