#pragma once

#include <QtTest/QtTest>

class MatchmakingEngineTest : public QObject {
    Q_OBJECT

private slots:
    void test_primaryIwadName();
    void test_picksBestScoringServer();
    void test_pingCeilingReason();
    void test_noMatchReasons();
    void test_skipsUnrespondedAndFullServers();
    void test_tieKeepsFirstServer();
    void test_gameTypeAndVersionFilters();
    void test_quickMatchStartsMonitoring();
    void test_monitoringTimesOut();
    void test_monitoringWithoutTimeout();
    void test_monitoringFindsMatchAndNotifies();
    void test_stopMonitoringIsIdempotent();
    void test_stopMonitoringDiscardsFoundMatch();
    void test_unknownClientVersionAcceptsCurrentServers();
};
