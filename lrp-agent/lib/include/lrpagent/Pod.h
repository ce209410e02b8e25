/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Include file for pods
 *
 * Copyright (c) 2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef LRPAGENT_POD_H
#define LRPAGENT_POD_H

#include <lrpagent/ObjectID.h>

#include <string>
#include <vector>
#include <map>
#include <ostream>
#include <cstdint>

namespace lrpagent {

/**
 * A set of labels attached to an object
 */
typedef std::map<std::string, std::string> labels_t;

/**
 * A pod as delivered by the pod watcher
 */
class Pod {
public:
    /**
     * A port exposed by a container of the pod
     */
    class ContainerPort {
    public:
        /**
         * Construct a container port
         *
         * @param name_ the port name, empty for an unnamed port
         * @param containerPort_ the port number
         * @param protocol_ the protocol name
         */
        ContainerPort(const std::string& name_, int32_t containerPort_,
                      const std::string& protocol_ = "TCP")
            : name(name_), containerPort(containerPort_),
              protocol(protocol_) {}

        /**
         * The port name
         */
        std::string name;

        /**
         * The port number as declared; not range checked
         */
        int32_t containerPort;

        /**
         * The protocol name as declared; not validated
         */
        std::string protocol;
    };

    /**
     * Default constructor
     */
    Pod() {}

    /**
     * Construct a pod
     *
     * @param ns the namespace of the pod
     * @param name the name of the pod
     */
    Pod(const std::string& ns, const std::string& name)
        : id(ns, name) {}

    /**
     * Get the namespace and name of the pod
     */
    const PodID& getID() const { return id; }

    /**
     * Get the name of the node the pod is scheduled on
     */
    const std::string& getNodeName() const { return nodeName; }

    /**
     * Set the name of the node the pod is scheduled on
     *
     * @param nodeName the node name
     */
    void setNodeName(const std::string& nodeName) {
        this->nodeName = nodeName;
    }

    /**
     * Get the pod labels
     */
    const labels_t& getLabels() const { return labels; }

    /**
     * Set a label on the pod
     *
     * @param key the label key
     * @param value the label value
     */
    void setLabel(const std::string& key, const std::string& value) {
        labels[key] = value;
    }

    /**
     * Replace the pod labels
     *
     * @param labels the new labels
     */
    void setLabels(const labels_t& labels) { this->labels = labels; }

    /**
     * Get the primary pod IP from the pod status, or an empty string
     */
    const std::string& getPodIP() const { return podIP; }

    /**
     * Set the primary pod IP
     *
     * @param podIP the IP address string
     */
    void setPodIP(const std::string& podIP) { this->podIP = podIP; }

    /**
     * Get the list of pod IPs from the pod status
     */
    const std::vector<std::string>& getPodIPs() const { return podIPs; }

    /**
     * Add an IP to the list of pod IPs
     *
     * @param ip the IP address string
     */
    void addPodIP(const std::string& ip) { podIPs.push_back(ip); }

    /**
     * Clear the primary pod IP and the list of pod IPs
     */
    void clearPodIPs() {
        podIP.clear();
        podIPs.clear();
    }

    /**
     * Get the ports declared by the pod's containers
     */
    const std::vector<ContainerPort>& getContainerPorts() const {
        return containerPorts;
    }

    /**
     * Add a container port
     *
     * @param port the port to add
     */
    void addContainerPort(const ContainerPort& port) {
        containerPorts.push_back(port);
    }

private:
    PodID id;
    std::string nodeName;
    labels_t labels;
    std::string podIP;
    std::vector<std::string> podIPs;
    std::vector<ContainerPort> containerPorts;
};

/**
 * Get the usable IPs of a pod: every parseable address from the pod
 * IP list and the primary pod IP, without duplicates, in the order
 * they appear.
 *
 * @param pod the pod
 * @return the list of IP address strings
 * @throws ValidationError if the pod has no usable IP
 */
std::vector<std::string> getValidIPs(const Pod& pod);

/**
 * Print a pod to an ostream
 */
std::ostream& operator<<(std::ostream& os, const Pod& pod);

} /* namespace lrpagent */

#endif /* LRPAGENT_POD_H */
