/*
 * =================================================================================
 * Project:   Kiosk PrintGate - Session & Print Budget Manager
 * File:      lib/PrintGate/TimeUtils.h
 *
 * Description:
 * Static helpers for countdown formatting and time-of-day windows.
 * Minutes-of-day values run 0..1439; windows may cross midnight.
 * =================================================================================
 */
#pragma once
#include <stddef.h>
#include <stdio.h>

class TimeUtils {
public:
    static const int MINUTES_PER_DAY = 1440;

    /**
     * Formats a countdown as "1h 5min 3s". Zero units are omitted,
     * except that "0s" is printed for an empty duration.
     */
    static void formatSeconds(unsigned long totalSeconds, char *buffer, size_t size) {
        if (size == 0) return;
        buffer[0] = '\0';

        unsigned long h = totalSeconds / 3600;
        unsigned long m = (totalSeconds % 3600) / 60;
        unsigned long s = totalSeconds % 60;

        size_t offset = 0;
        auto append = [&](unsigned long val, const char* suffix) {
            if (offset >= size) return;
            int written = snprintf(buffer + offset, size - offset, "%s%lu%s", offset > 0 ? " " : "", val, suffix);
            if (written > 0) offset += (size_t)written;
        };

        if (h > 0) append(h, "h");
        if (m > 0) append(m, "min");
        if (s > 0 || offset == 0) append(s, "s");
    }

    // "HH:MM" for a minutes-of-day value.
    static void formatClock(int minutesOfDay, char *buffer, size_t size) {
        int m = normalize(minutesOfDay);
        snprintf(buffer, size, "%02d:%02d", m / 60, m % 60);
    }

    /**
     * True if 'now' lies inside [start, end). A window whose end is before its
     * start crosses midnight ("22:00" - "02:00"). start == end means always open.
     */
    static bool isWithinWindow(int now, int start, int end) {
        now = normalize(now);
        start = normalize(start);
        end = normalize(end);

        if (start == end) return true;
        if (start < end) return now >= start && now < end;
        return now >= start || now < end;
    }

    // Minutes from 'now' forward to 'target', wrapping at midnight (0..1439).
    static int minutesUntil(int now, int target) {
        return normalize(target - now);
    }

private:
    static int normalize(int minutes) {
        int m = minutes % MINUTES_PER_DAY;
        return m < 0 ? m + MINUTES_PER_DAY : m;
    }
};
