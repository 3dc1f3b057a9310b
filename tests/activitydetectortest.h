#pragma once

#include <QtTest/QtTest>

class ActivityDetectorTest : public QObject {
    Q_OBJECT

private slots:
    void test_playersJoined();
    void test_repeatSnapshotIsQuiet();
    void test_newServers();
    void test_playersLeftUsesAddressWhenUnnamed();
    void test_notificationPreview();
    void test_reset();
};
