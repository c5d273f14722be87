#pragma once

#include <string>
#include <vector>
#include <highfive/H5File.hpp>

// Read a 1-D dataset of any HighFive-supported element type
template <typename T>
std::vector<T> read_hdf5_vector(const std::string& filename, const std::string& dataset_path) {
    HighFive::File file(filename, HighFive::File::ReadOnly);
    HighFive::DataSet dataset = file.getDataSet(dataset_path);

    std::vector<T> values;
    dataset.read(values);
    return values;
}

template <typename T>
T read_hdf5_scalar(const std::string& filename, const std::string& dataset_path) {
    HighFive::File file(filename, HighFive::File::ReadOnly);
    HighFive::DataSet dataset = file.getDataSet(dataset_path);

    T value;
    dataset.read(value);
    return value;
}

// Create or replace a dataset in a group
template <typename T>
void write_hdf5_dataset(HighFive::Group& group, const std::string& name, const T& value) {
    if (group.exist(name)) {
        group.unlink(name);
    }
    group.createDataSet(name, value);
}
