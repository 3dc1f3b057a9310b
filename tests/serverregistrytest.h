#pragma once

#include <QtTest/QtTest>

class ServerRegistryTest : public QObject {
    Q_OBJECT

private slots:
    void test_setServersClearsLoadingAndError();
    void test_setServersDedupesByAddress();
    void test_snapshotsAreImmutable();
    void test_updateServerPingPatchesBothLists();
    void test_updateServerPingUnknownAddress();
    void test_findServerAndCounts();
    void test_reset();
    void test_visibilityFilter();
    void test_versionCompatibility();
};
